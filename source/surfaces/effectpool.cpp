#include "effectpool.h"
#include "delayedactions.h"
#include "../common/outputmessages.h"
#include "../common/sfxbasicmath.h"

#include <limits>
#include <utility>

namespace sfx {

auto PooledEffectInstance::getPrefab() const -> sfx::StringView {
	return sfx::StringView( m_prefab->data(), m_prefab->size(), sfx::StringView::ZeroTerminated );
}

void PooledEffectInstance::activate( const float *origin, const mat3_t axis ) {
	if( !m_isActive ) {
		m_isActive = true;
		m_pool->m_numActiveInstances++;
	}
	m_activationSequence = ++m_pool->m_activationCounter;
	m_activationTime     = m_pool->m_scheduler->getLastTime();
	VectorCopy( origin, m_origin );
	Matrix3_Copy( axis, m_axis );
}

void PooledEffectInstance::deactivate() {
	if( m_isActive ) {
		m_isActive = false;
		m_hasSound = false;
		m_soundClip.clear();
		m_soundVolume = 0.0f;
		m_generation++;
		m_pool->m_numActiveInstances--;
	}
}

void PooledEffectInstance::deactivateAfter( unsigned millis ) {
	m_pool->m_scheduler->schedule( millis, &PooledEffectInstance::deactivateIfSameGeneration, this, m_generation );
}

void PooledEffectInstance::deactivateIfSameGeneration( void *instance, uint64_t generation ) {
	auto *const pooledInstance = (PooledEffectInstance *)instance;
	if( pooledInstance->m_generation == generation ) {
		pooledInstance->deactivate();
	}
}

void PooledEffectInstance::startSound( const sfx::StringView &clip, float volume ) {
	if( !m_isActive ) [[unlikely]] {
		fxWarning() << "Attempting to start the sound" << clip << "using an inactive instance of" << getPrefab();
		return;
	}
	m_soundClip.assign( clip.data(), clip.size() );
	m_soundVolume = sfx::clamp( volume, 0.0f, 1.0f );
	m_hasSound    = true;
}

EffectInstancePool::~EffectInstancePool() {
	// Make sure that no deferred action refers to instances of this pool
	m_scheduler->clear();
}

auto EffectInstancePool::findOrCreatePrefabPool( const sfx::StringView &prefab, unsigned poolSizeHint ) -> PrefabPool * {
	if( const auto it = m_prefabPoolsByName.find( prefab.asStdView() ); it != m_prefabPoolsByName.end() ) {
		return it->second;
	}

	auto prefabPool    = std::make_unique<PrefabPool>();
	prefabPool->prefab = std::string( prefab.data(), prefab.size() );
	// The vector never grows afterwards, so addresses of instances stay stable
	prefabPool->instances.resize( sfx::max( 1u, poolSizeHint ) );
	for( PooledEffectInstance &instance: prefabPool->instances ) {
		instance.m_pool   = this;
		instance.m_prefab = std::addressof( prefabPool->prefab );
	}

	PrefabPool *const result = prefabPool.get();
	m_prefabPools.emplace_back( std::move( prefabPool ) );
	m_prefabPoolsByName.insert( { std::string_view( result->prefab ), result } );

	fxDebug() << "Created a pool of" << (unsigned)result->instances.size() << "instances for the prefab" << prefab;
	return result;
}

auto EffectInstancePool::acquire( const sfx::StringView &prefab, unsigned poolSizeHint ) -> PooledEffectInstance * {
	PrefabPool *const prefabPool = findOrCreatePrefabPool( prefab, poolSizeHint );

	PooledEffectInstance *oldestInstance = nullptr;
	uint64_t oldestActivationSequence    = std::numeric_limits<uint64_t>::max();
	for( PooledEffectInstance &instance: prefabPool->instances ) {
		if( !instance.m_isActive ) {
			return std::addressof( instance );
		}
		if( oldestActivationSequence > instance.m_activationSequence ) {
			oldestActivationSequence = instance.m_activationSequence;
			oldestInstance           = std::addressof( instance );
		}
	}

	// The pool is never empty, so there must be some active instance
	oldestInstance->deactivate();
	m_numReclaimedInstances++;
	return oldestInstance;
}

void EffectInstancePool::deactivateAll() {
	for( std::unique_ptr<PrefabPool> &prefabPool: m_prefabPools ) {
		for( PooledEffectInstance &instance: prefabPool->instances ) {
			instance.deactivate();
		}
	}
}

auto EffectInstancePool::getCurrentTime() const -> int64_t {
	return m_scheduler->getLastTime();
}

auto EffectInstancePool::getPoolCapacity( const sfx::StringView &prefab ) const -> unsigned {
	if( const auto it = m_prefabPoolsByName.find( prefab.asStdView() ); it != m_prefabPoolsByName.end() ) {
		return (unsigned)it->second->instances.size();
	}
	return 0;
}

}
