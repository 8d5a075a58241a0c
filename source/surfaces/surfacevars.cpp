#include "surfacevars.h"

using sfx::operator""_asView;

namespace sfx {

FloatConfigVar v_surfaceOffset( "sfx_surfaceOffset"_asView, {
	.byDefault = 0.001f, .minInclusive = 0.0f, .maxInclusive = 16.0f,
	.desc = "An offset of spawned visual effects along the hit normal",
});

UnsignedConfigVar v_effectPoolSize( "sfx_effectPoolSize"_asView, {
	.byDefault = 10, .minInclusive = 1, .maxInclusive = 1024,
	.desc = "A capacity of a pool of instances of an effect prefab",
});

EnumValueConfigVar<TerrainOutOfRangePolicy, TerrainOutOfRangePolicyMatcher> v_terrainOutOfRangePolicy( "sfx_terrainOutOfRangePolicy"_asView, {
	.byDefault = TerrainOutOfRangePolicy::Clamp,
	.desc = "What to do with terrain hits that fall outside of the alpha map",
});

BoolConfigVar v_canonicalTriangleMatch( "sfx_canonicalTriangleMatch"_asView, {
	.byDefault = false, .desc = "Whether vertex indices of triangles are compared regardless of their order",
});

BoolConfigVar v_warnOnUnsupportedTargets( "sfx_warnOnUnsupportedTargets"_asView, {
	.byDefault = true, .desc = "Whether impacts against unsupported targets should be reported",
});

BoolConfigVar v_debugImpacts( "sfx_debugImpacts"_asView, {
	.byDefault = false, .desc = "Whether resolved contributions of impacts should be printed",
});

BoolConfigVar v_limitImpactSounds( "sfx_limitImpactSounds"_asView, {
	.byDefault = false, .desc = "Whether close impact sounds of the same emitter prefab should be dropped",
});

}
