#ifndef SFX_169618b0_bc8c_40e0_b111_78ab2afe6d63_H
#define SFX_169618b0_bc8c_40e0_b111_78ab2afe6d63_H

#include "../common/q_math.h"
#include "../common/sfxstringview.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sfx {

class DelayedActionScheduler;
class EffectInstancePool;

/// A reusable slot of a prefab pool.
/// Hosts read active instances every frame and submit them to the renderer or the audio mixer.
class PooledEffectInstance {
	friend class EffectInstancePool;
public:
	[[nodiscard]]
	auto getPrefab() const -> sfx::StringView;
	[[nodiscard]]
	bool isActive() const { return m_isActive; }
	/// Gets incremented on every deactivation
	[[nodiscard]]
	auto getGeneration() const -> uint64_t { return m_generation; }
	[[nodiscard]]
	auto getActivationTime() const -> int64_t { return m_activationTime; }

	[[nodiscard]]
	auto getOrigin() const -> const float * { return m_origin; }
	[[nodiscard]]
	auto getAxis() const -> const float * { return m_axis; }

	[[nodiscard]]
	bool hasSound() const { return m_hasSound; }
	[[nodiscard]]
	auto getSoundClip() const -> sfx::StringView { return sfx::StringView( m_soundClip.data(), m_soundClip.size() ); }
	[[nodiscard]]
	auto getSoundVolume() const -> float { return m_soundVolume; }

	void activate( const float *origin, const mat3_t axis );
	/// Does nothing if the instance is already inactive
	void deactivate();
	/// Schedules deactivation of the current activation.
	/// The deferred action does nothing if the instance gets deactivated or reassigned in the meantime.
	void deactivateAfter( unsigned millis );
	/// Starts a one-shot sound. The instance must be active.
	void startSound( const sfx::StringView &clip, float volume );
private:
	static void deactivateIfSameGeneration( void *instance, uint64_t generation );

	EffectInstancePool *m_pool { nullptr };
	const std::string *m_prefab { nullptr };
	uint64_t m_generation { 0 };
	uint64_t m_activationSequence { 0 };
	int64_t m_activationTime { 0 };
	vec3_t m_origin { 0.0f, 0.0f, 0.0f };
	mat3_t m_axis { 1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 1.0f };
	std::string m_soundClip;
	float m_soundVolume { 0.0f };
	bool m_isActive { false };
	bool m_hasSound { false };
};

/// Keeps fixed-capacity pools of effect instances for every prefab.
/// Instance storage is never released while the pool lives.
class EffectInstancePool {
	friend class PooledEffectInstance;
public:
	/// The scheduler must outlive the pool.
	/// It may be shared with other users, but the destruction of the pool runs all its pending actions,
	/// including ones that were not scheduled by the pool.
	explicit EffectInstancePool( DelayedActionScheduler *scheduler ) : m_scheduler( scheduler ) {}
	~EffectInstancePool();

	EffectInstancePool( const EffectInstancePool & ) = delete;
	auto operator=( const EffectInstancePool & ) -> EffectInstancePool & = delete;

	/// Returns an inactive instance of the prefab.
	/// The pool of the prefab gets created on demand with the supplied capacity hint.
	/// If all instances of the prefab are active, the oldest one gets reclaimed.
	[[nodiscard]]
	auto acquire( const sfx::StringView &prefab, unsigned poolSizeHint ) -> PooledEffectInstance *;

	/// Deactivates all instances
	void deactivateAll();

	template <typename Fn>
	void forEachActiveInstance( Fn &&fn ) const {
		for( const std::unique_ptr<PrefabPool> &prefabPool: m_prefabPools ) {
			for( const PooledEffectInstance &instance: prefabPool->instances ) {
				if( instance.m_isActive ) {
					fn( instance );
				}
			}
		}
	}

	/// The frame time of the last drain of the scheduler
	[[nodiscard]]
	auto getCurrentTime() const -> int64_t;

	[[nodiscard]]
	auto getNumActiveInstances() const -> unsigned { return m_numActiveInstances; }
	[[nodiscard]]
	auto getNumReclaimedInstances() const -> uint64_t { return m_numReclaimedInstances; }
	/// Returns zero if there is no pool for the prefab yet
	[[nodiscard]]
	auto getPoolCapacity( const sfx::StringView &prefab ) const -> unsigned;
private:
	struct PrefabPool {
		std::string prefab;
		std::vector<PooledEffectInstance> instances;
	};

	[[nodiscard]]
	auto findOrCreatePrefabPool( const sfx::StringView &prefab, unsigned poolSizeHint ) -> PrefabPool *;

	DelayedActionScheduler *const m_scheduler;
	std::vector<std::unique_ptr<PrefabPool>> m_prefabPools;
	// Keys refer to names held by prefab pools
	std::unordered_map<std::string_view, PrefabPool *> m_prefabPoolsByName;
	uint64_t m_activationCounter { 0 };
	uint64_t m_numReclaimedInstances { 0 };
	unsigned m_numActiveInstances { 0 };
};

}

#endif
