#include "impactdispatchertest.h"
#include "testutils.h"
#include "../delayedactions.h"
#include "../effectplayer.h"
#include "../effectpool.h"
#include "../impactdispatcher.h"
#include "../materialregistry.h"
#include "../surfacevars.h"
#include "../../common/configvars.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using sfx::operator""_asView;
using namespace sfx::tests;

namespace {

struct DispatchFixture {
	std::vector<sfx::MaterialProfile> profiles;
	sfx::MaterialProfile defaultProfile;
	sfx::MaterialRegistry registry;
	sfx::GeometrySurfaceResolver resolver;
	sfx::DelayedActionScheduler scheduler;
	sfx::EffectInstancePool pool { &scheduler };
	sfx::RandomGenerator rng;
	sfx::EffectPlayer player { &pool, &rng };
	sfx::ImpactDispatcher dispatcher { &registry, &resolver, &player };

	DispatchFixture()
		: profiles( makeProfiles() )
		, defaultProfile( makeProfile( "Default", "", sfx::ImpactKind::Bullet, makeBundle( "generic_dust", nullptr, nullptr ) ) )
		, registry( profiles, defaultProfile ) {}

	static auto makeProfiles() -> std::vector<sfx::MaterialProfile> {
		std::vector<sfx::MaterialProfile> result;
		result.emplace_back( makeProfile( "Brick", "brick_albedo", sfx::ImpactKind::Bullet, makeBundle( "brick_chips", "impact_emitter", "c1" ) ) );
		result.emplace_back( makeProfile( "Grass", "grass_albedo", sfx::ImpactKind::Bullet, makeBundle( nullptr, "impact_emitter", "rustle" ) ) );
		result.emplace_back( makeProfile( "Dirt", "dirt_albedo", sfx::ImpactKind::Bullet, makeBundle( nullptr, "impact_emitter", "thump" ) ) );
		return result;
	}

	[[nodiscard]]
	auto collectActiveInstances() const -> std::vector<const sfx::PooledEffectInstance *> {
		std::vector<const sfx::PooledEffectInstance *> result;
		pool.forEachActiveInstance( [&]( const sfx::PooledEffectInstance &instance ) {
			result.push_back( std::addressof( instance ) );
		});
		return result;
	}

	[[nodiscard]]
	auto findActiveInstance( const char *prefab ) const -> const sfx::PooledEffectInstance * {
		for( const sfx::PooledEffectInstance *instance: collectActiveInstances() ) {
			if( instance->getPrefab().equals( sfx::StringView( prefab ) ) ) {
				return instance;
			}
		}
		return nullptr;
	}
};

const uint32_t kMeshIndices[] { 0, 1, 2, 2, 3, 0, 4, 5, 6, 6, 7, 4, 8, 9, 10, 10, 11, 8 };
const uint32_t kConcreteIndices[] { 0, 1, 2, 2, 3, 0, 4, 5, 6, 6, 7, 4 };
const uint32_t kBrickIndices[] { 8, 9, 10, 10, 11, 8 };

const sfx::MeshRegion kMeshRegions[] {
	{ .triangleIndices = kConcreteIndices, .texture = "concrete_albedo"_asView },
	{ .triangleIndices = kBrickIndices, .texture = "brick_albedo"_asView },
};

const sfx::MeshSurfaceData kMesh {
	.name = "wall"_asView, .triangleIndices = kMeshIndices, .regions = kMeshRegions, .primaryTexture = "concrete_albedo"_asView,
};

const sfx::StringView kLayerTextures[] { "grass_albedo"_asView, "dirt_albedo"_asView };
// A single cell
const float kAlphaMap[] { 0.25f, 0.75f };

const sfx::TerrainSurfaceData kTerrain {
	.origin = { 0.0f, 0.0f, 0.0f }, .size = { 100.0f, 100.0f }, .alphaMapWidth = 1, .alphaMapHeight = 1,
	.layerTextures = kLayerTextures, .alphaMap = kAlphaMap,
};

const vec3_t kHitNormal { 0.0f, 1.0f, 0.0f };

}

void ImpactDispatcherTest::cleanup() {
	sfx::v_warnOnUnsupportedTargets.resetToDefault();
	sfx::v_debugImpacts.resetToDefault();
	(void)sfx::DeclaredConfigVar::setByName( "sfx_developer"_asView, "0"_asView );
}

void ImpactDispatcherTest::test_meshImpact() {
	DispatchFixture fixture;
	ScopedMessageCapture capture;

	const vec3_t hitPoint { 1.0f, 0.0f, 0.0f };
	const unsigned numSpawned = fixture.dispatcher.handleImpact( &kMesh, hitPoint, kHitNormal, sfx::ImpactKind::Bullet, 5 );
	QCOMPARE( numSpawned, 2u );
	QCOMPARE( fixture.pool.getNumActiveInstances(), 2u );

	const sfx::PooledEffectInstance *chips = fixture.findActiveInstance( "brick_chips" );
	QVERIFY( chips );
	QVERIFY( std::fabs( chips->getOrigin()[0] - 1.0f ) < 1e-6f );
	QVERIFY( std::fabs( chips->getOrigin()[1] - 0.001f ) < 1e-6f );
	QVERIFY( std::fabs( chips->getOrigin()[2] ) < 1e-6f );

	const sfx::PooledEffectInstance *emitter = fixture.findActiveInstance( "impact_emitter" );
	QVERIFY( emitter );
	QCOMPARE( emitter->getSoundClip().asStdView(), std::string_view( "c1" ) );
	QCOMPARE( emitter->getSoundVolume(), 1.0f );

	QCOMPARE( capture.countLines( sfx::MessageCategory::Warning ), 0u );
	QCOMPARE( capture.countLines( sfx::MessageCategory::Error ), 0u );

	// The first triangle belongs to the concrete region which has no profile
	fixture.pool.deactivateAll();
	QCOMPARE( fixture.dispatcher.handleImpact( &kMesh, hitPoint, kHitNormal, sfx::ImpactKind::Bullet, 0 ), 1u );
	QVERIFY( fixture.findActiveInstance( "generic_dust" ) );
}

void ImpactDispatcherTest::test_terrainImpact() {
	DispatchFixture fixture;

	const vec3_t hitPoint { 50.0f, 50.0f, 0.0f };
	const unsigned numSpawned = fixture.dispatcher.handleImpact( &kTerrain, hitPoint, kHitNormal, sfx::ImpactKind::Bullet );
	QCOMPARE( numSpawned, 2u );

	std::vector<std::pair<std::string, float>> sounds;
	for( const sfx::PooledEffectInstance *instance: fixture.collectActiveInstances() ) {
		QVERIFY( instance->hasSound() );
		sounds.emplace_back( std::make_pair( std::string( instance->getSoundClip().asStdView() ), instance->getSoundVolume() ) );
	}
	QCOMPARE( sounds.size(), (size_t)2 );
	std::sort( sounds.begin(), sounds.end() );
	QCOMPARE( sounds[0].first, std::string( "rustle" ) );
	QCOMPARE( sounds[0].second, 0.25f );
	QCOMPARE( sounds[1].first, std::string( "thump" ) );
	QCOMPARE( sounds[1].second, 0.75f );
}

void ImpactDispatcherTest::test_unsupportedTarget() {
	DispatchFixture fixture;
	const vec3_t hitPoint { 0.0f, 0.0f, 0.0f };

	{
		ScopedMessageCapture capture;
		QCOMPARE( fixture.dispatcher.handleImpact( sfx::ImpactTarget {}, hitPoint, kHitNormal, sfx::ImpactKind::Explosion ), 0u );
		QCOMPARE( capture.countLines( sfx::MessageCategory::Warning ), 1u );
		QVERIFY( capture.hasLineContaining( sfx::MessageCategory::Warning, "'Explosion'" ) );
	}

	sfx::v_warnOnUnsupportedTargets.set( false );
	{
		ScopedMessageCapture capture;
		QCOMPARE( fixture.dispatcher.handleImpact( sfx::ImpactTarget {}, hitPoint, kHitNormal, sfx::ImpactKind::Explosion ), 0u );
		QVERIFY( capture.m_lines.empty() );
	}

	QCOMPARE( fixture.pool.getNumActiveInstances(), 0u );
}

void ImpactDispatcherTest::test_missingBundle() {
	DispatchFixture fixture;
	ScopedMessageCapture capture;

	const vec3_t hitPoint { 1.0f, 0.0f, 0.0f };
	QCOMPARE( fixture.dispatcher.handleImpact( &kMesh, hitPoint, kHitNormal, sfx::ImpactKind::Footstep, 5 ), 0u );
	QCOMPARE( fixture.pool.getNumActiveInstances(), 0u );
	QVERIFY( capture.m_lines.empty() );
}

void ImpactDispatcherTest::test_fallbackToDefaultProfile() {
	DispatchFixture fixture;
	ScopedMessageCapture capture;

	const sfx::MeshSurfaceData meshWithoutGeometry { .name = "broken"_asView, .primaryTexture = "brick_albedo"_asView };
	const vec3_t hitPoint { 0.0f, 0.0f, 0.0f };
	QCOMPARE( fixture.dispatcher.handleImpact( &meshWithoutGeometry, hitPoint, kHitNormal, sfx::ImpactKind::Bullet ), 1u );
	QVERIFY( fixture.findActiveInstance( "generic_dust" ) );
	QCOMPARE( capture.countLines( sfx::MessageCategory::Error ), 1u );

	// A hit of an empty cell of the terrain
	const float emptyAlphaMap[] { 0.0f, 0.0f };
	sfx::TerrainSurfaceData emptyTerrain = kTerrain;
	emptyTerrain.alphaMap = emptyAlphaMap;

	fixture.pool.deactivateAll();
	const vec3_t terrainHitPoint { 10.0f, 10.0f, 0.0f };
	QCOMPARE( fixture.dispatcher.handleImpact( &emptyTerrain, terrainHitPoint, kHitNormal, sfx::ImpactKind::Bullet ), 1u );
	QVERIFY( fixture.findActiveInstance( "generic_dust" ) );
}

void ImpactDispatcherTest::test_nullTargets() {
	DispatchFixture fixture;
	ScopedMessageCapture capture;

	const vec3_t hitPoint { 0.0f, 0.0f, 0.0f };
	const sfx::TerrainSurfaceData *nullTerrain = nullptr;
	const sfx::MeshSurfaceData *nullMesh = nullptr;
	QCOMPARE( fixture.dispatcher.handleImpact( nullTerrain, hitPoint, kHitNormal, sfx::ImpactKind::Bullet ), 0u );
	QCOMPARE( fixture.dispatcher.handleImpact( nullMesh, hitPoint, kHitNormal, sfx::ImpactKind::Bullet ), 0u );
	QCOMPARE( capture.countLines( sfx::MessageCategory::Warning ), 2u );
}

void ImpactDispatcherTest::test_debugOutput() {
	DispatchFixture fixture;
	ScopedMessageCapture capture;

	const vec3_t hitPoint { 50.0f, 50.0f, 0.0f };
	sfx::v_debugImpacts.set( true );
	(void)fixture.dispatcher.handleImpact( &kTerrain, hitPoint, kHitNormal, sfx::ImpactKind::Bullet );
	// Debug messages are suppressed unless the developer mode is on
	QCOMPARE( capture.countLines( sfx::MessageCategory::Debug ), 0u );

	QVERIFY( sfx::DeclaredConfigVar::setByName( "sfx_developer"_asView, "1"_asView ) == std::optional( true ) );
	(void)fixture.dispatcher.handleImpact( &kTerrain, hitPoint, kHitNormal, sfx::ImpactKind::Bullet );
	QCOMPARE( capture.countLines( sfx::MessageCategory::Debug ), 2u );
	QVERIFY( capture.hasLineContaining( sfx::MessageCategory::Debug, "'Grass'" ) );
	QVERIFY( capture.hasLineContaining( sfx::MessageCategory::Debug, "'Dirt'" ) );
}
