#include "effectpooltest.h"
#include "testutils.h"
#include "../delayedactions.h"
#include "../effectpool.h"

#include <string>
#include <vector>

using sfx::operator""_asView;
using namespace sfx::tests;

static const vec3_t kOrigin { 1.0f, 2.0f, 3.0f };
static const mat3_t kIdentityAxis { 1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 1.0f };

void EffectPoolTest::test_capacityOfPool() {
	sfx::DelayedActionScheduler scheduler;
	sfx::EffectInstancePool pool( &scheduler );

	QCOMPARE( pool.getPoolCapacity( "dust"_asView ), 0u );
	(void)pool.acquire( "dust"_asView, 3 );
	QCOMPARE( pool.getPoolCapacity( "dust"_asView ), 3u );

	// Further hints do not change the capacity
	(void)pool.acquire( "dust"_asView, 10 );
	QCOMPARE( pool.getPoolCapacity( "dust"_asView ), 3u );

	// A zero hint still yields a usable pool
	QVERIFY( pool.acquire( "sparks"_asView, 0 ) );
	QCOMPARE( pool.getPoolCapacity( "sparks"_asView ), 1u );
}

void EffectPoolTest::test_activation() {
	sfx::DelayedActionScheduler scheduler;
	sfx::EffectInstancePool pool( &scheduler );

	scheduler.runDueActions( 500 );
	QCOMPARE( pool.getCurrentTime(), (int64_t)500 );

	sfx::PooledEffectInstance *instance = pool.acquire( "dust"_asView, 2 );
	QVERIFY( !instance->isActive() );
	QCOMPARE( instance->getPrefab().asStdView(), std::string_view( "dust" ) );

	instance->activate( kOrigin, kIdentityAxis );
	QVERIFY( instance->isActive() );
	QCOMPARE( instance->getActivationTime(), (int64_t)500 );
	QVERIFY( VectorCompare( instance->getOrigin(), kOrigin ) );
	QCOMPARE( pool.getNumActiveInstances(), 1u );

	// The next acquisition yields another free instance
	sfx::PooledEffectInstance *anotherInstance = pool.acquire( "dust"_asView, 2 );
	QVERIFY( anotherInstance != instance );
	QVERIFY( !anotherInstance->isActive() );
	QCOMPARE( pool.getNumReclaimedInstances(), (uint64_t)0 );
}

void EffectPoolTest::test_reclaimingOldestInstance() {
	sfx::DelayedActionScheduler scheduler;
	sfx::EffectInstancePool pool( &scheduler );

	std::vector<sfx::PooledEffectInstance *> instances;
	for( unsigned i = 0; i < 3; ++i ) {
		sfx::PooledEffectInstance *instance = pool.acquire( "dust"_asView, 3 );
		instance->activate( kOrigin, kIdentityAxis );
		instances.push_back( instance );
	}
	QCOMPARE( pool.getNumActiveInstances(), 3u );

	// Reactivation makes the first instance the newest one
	instances[0]->activate( kOrigin, kIdentityAxis );

	const uint64_t oldGeneration = instances[1]->getGeneration();
	sfx::PooledEffectInstance *reclaimed = pool.acquire( "dust"_asView, 3 );
	QCOMPARE( reclaimed, instances[1] );
	QVERIFY( !reclaimed->isActive() );
	QCOMPARE( reclaimed->getGeneration(), oldGeneration + 1 );
	QCOMPARE( pool.getNumReclaimedInstances(), (uint64_t)1 );
	QCOMPARE( pool.getNumActiveInstances(), 2u );
}

void EffectPoolTest::test_deactivationIsIdempotent() {
	sfx::DelayedActionScheduler scheduler;
	sfx::EffectInstancePool pool( &scheduler );

	sfx::PooledEffectInstance *instance = pool.acquire( "dust"_asView, 1 );
	instance->activate( kOrigin, kIdentityAxis );
	const uint64_t generation = instance->getGeneration();

	instance->deactivate();
	instance->deactivate();
	QCOMPARE( instance->getGeneration(), generation + 1 );
	QCOMPARE( pool.getNumActiveInstances(), 0u );

	instance->activate( kOrigin, kIdentityAxis );
	pool.deactivateAll();
	pool.deactivateAll();
	QCOMPARE( pool.getNumActiveInstances(), 0u );
}

void EffectPoolTest::test_staleDeferredDeactivation() {
	sfx::DelayedActionScheduler scheduler;
	sfx::EffectInstancePool pool( &scheduler );

	sfx::PooledEffectInstance *instance = pool.acquire( "emitter"_asView, 1 );
	instance->activate( kOrigin, kIdentityAxis );
	instance->deactivateAfter( 100 );

	// The single instance gets reclaimed and reassigned before the deferred deactivation
	scheduler.runDueActions( 50 );
	sfx::PooledEffectInstance *reassigned = pool.acquire( "emitter"_asView, 1 );
	QCOMPARE( reassigned, instance );
	reassigned->activate( kOrigin, kIdentityAxis );
	reassigned->deactivateAfter( 1000 );

	scheduler.runDueActions( 100 );
	QVERIFY( reassigned->isActive() );

	scheduler.runDueActions( 1049 );
	QVERIFY( reassigned->isActive() );

	scheduler.runDueActions( 1050 );
	QVERIFY( !reassigned->isActive() );
	QCOMPARE( pool.getNumActiveInstances(), 0u );
}

void EffectPoolTest::test_forEachActiveInstance() {
	sfx::DelayedActionScheduler scheduler;
	sfx::EffectInstancePool pool( &scheduler );

	sfx::PooledEffectInstance *dust1 = pool.acquire( "dust"_asView, 2 );
	dust1->activate( kOrigin, kIdentityAxis );
	sfx::PooledEffectInstance *sparks = pool.acquire( "sparks"_asView, 2 );
	sparks->activate( kOrigin, kIdentityAxis );
	sfx::PooledEffectInstance *dust2 = pool.acquire( "dust"_asView, 2 );
	dust2->activate( kOrigin, kIdentityAxis );
	// Never activated
	(void)pool.acquire( "debris"_asView, 2 );

	std::vector<const sfx::PooledEffectInstance *> visited;
	pool.forEachActiveInstance( [&]( const sfx::PooledEffectInstance &instance ) {
		visited.push_back( std::addressof( instance ) );
	});

	const std::vector<const sfx::PooledEffectInstance *> expected { dust1, dust2, sparks };
	QVERIFY( visited == expected );
}

void EffectPoolTest::test_soundOfInactiveInstance() {
	sfx::DelayedActionScheduler scheduler;
	sfx::EffectInstancePool pool( &scheduler );
	ScopedMessageCapture capture;

	sfx::PooledEffectInstance *instance = pool.acquire( "emitter"_asView, 1 );
	instance->startSound( "clang"_asView, 1.0f );
	QVERIFY( !instance->hasSound() );
	QCOMPARE( capture.countLines( sfx::MessageCategory::Warning ), 1u );

	instance->activate( kOrigin, kIdentityAxis );
	instance->startSound( "clang"_asView, 1.5f );
	QVERIFY( instance->hasSound() );
	QCOMPARE( instance->getSoundClip().asStdView(), std::string_view( "clang" ) );
	QCOMPARE( instance->getSoundVolume(), 1.0f );

	instance->deactivate();
	QVERIFY( !instance->hasSound() );
}

static void recordCall( void *arg, uint64_t ) {
	( *(unsigned *)arg )++;
}

void EffectPoolTest::test_destructionFlushesScheduler() {
	sfx::DelayedActionScheduler scheduler;
	unsigned numCalls = 0;
	{
		sfx::EffectInstancePool pool( &scheduler );
		sfx::PooledEffectInstance *instance = pool.acquire( "emitter"_asView, 1 );
		instance->activate( kOrigin, kIdentityAxis );
		instance->deactivateAfter( 10000 );
		scheduler.schedule( 20000, &recordCall, &numCalls );
	}
	QCOMPARE( scheduler.size(), 0u );
	QCOMPARE( numCalls, 1u );

	// The scheduler stays usable after the pool is gone
	scheduler.schedule( 0, &recordCall, &numCalls );
	QCOMPARE( scheduler.size(), 1u );
	scheduler.runDueActions( scheduler.getLastTime() + 1 );
	QCOMPARE( scheduler.size(), 0u );
	QCOMPARE( numCalls, 2u );
}
