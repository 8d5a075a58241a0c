#ifndef SFX_45e40a7a_d187_40e8_ae77_565d536c65a1_H
#define SFX_45e40a7a_d187_40e8_ae77_565d536c65a1_H

#include "../common/configvars.h"
#include "../common/enumtokenmatcher.h"

#include <cstdint>

namespace sfx {

enum class TerrainOutOfRangePolicy : uint8_t {
	// Use the nearest cell of the alpha map
	Clamp,
	// Fail the resolution so the default profile gets used
	Reject,
};

class TerrainOutOfRangePolicyMatcher : public sfx::EnumTokenMatcher<TerrainOutOfRangePolicy, TerrainOutOfRangePolicyMatcher> {
public:
	TerrainOutOfRangePolicyMatcher()
		: sfx::EnumTokenMatcher<TerrainOutOfRangePolicy, TerrainOutOfRangePolicyMatcher>( {
			{ sfx::StringView( "Clamp" ), TerrainOutOfRangePolicy::Clamp },
			{ sfx::StringView( "Reject" ), TerrainOutOfRangePolicy::Reject },
		}) {}
};

extern FloatConfigVar v_surfaceOffset;
extern UnsignedConfigVar v_effectPoolSize;
extern EnumValueConfigVar<TerrainOutOfRangePolicy, TerrainOutOfRangePolicyMatcher> v_terrainOutOfRangePolicy;
extern BoolConfigVar v_canonicalTriangleMatch;
extern BoolConfigVar v_warnOnUnsupportedTargets;
extern BoolConfigVar v_debugImpacts;
extern BoolConfigVar v_limitImpactSounds;

}

#endif
