#ifndef SFX_915204f9_ad7b_48da_928d_012ac3a81a45_H
#define SFX_915204f9_ad7b_48da_928d_012ac3a81a45_H

#include "materialprofile.h"
#include "../common/q_math.h"
#include "../common/randomgenerator.h"
#include "../common/staticdeque.h"
#include "../common/staticvector.h"

#include <cstdint>
#include <optional>
#include <string>

namespace sfx {

class EffectInstancePool;

/// Drops impact sounds that are too close in space and time to recently started ones.
/// Events are tracked separately for every group (an emitter prefab).
class ImpactSoundRateLimiter {
public:
	struct Params {
		float dropChanceAtZeroDistance { 0.5f };
		float startDroppingAtDistance { 1.5f };
		float dropChanceAtZeroTimeDiff { 1.0f };
		unsigned startDroppingAtTimeDiff { 250 };
	};

	explicit ImpactSoundRateLimiter( RandomGenerator *rng ) : ImpactSoundRateLimiter( rng, Params {} ) {}
	ImpactSoundRateLimiter( RandomGenerator *rng, const Params &params );

	/// Registers the event if it is allowed
	[[nodiscard]]
	bool acquirePermission( int64_t timestamp, const float *origin, const sfx::StringView &group );

	void clear();
private:
	class GroupLimiter {
	public:
		[[nodiscard]]
		bool acquirePermission( int64_t timestamp, const float *origin, const Params &params, RandomGenerator *rng );
		[[nodiscard]]
		auto getLastTimestamp() const -> std::optional<int64_t> {
			return !m_entries.empty() ? std::optional( m_entries.back().timestamp ) : std::nullopt;
		}
		void clear() { m_entries.clear(); }
	private:
		struct Entry {
			int64_t timestamp;
			vec3_t origin;
		};

		sfx::StaticDeque<Entry, 24> m_entries;
	};

	struct GroupEntry {
		std::string group;
		GroupLimiter limiter;
	};

	RandomGenerator *const m_rng;
	const Params m_params;
	sfx::StaticVector<GroupEntry, 8> m_groupEntries;
};

/// Spawns visual and audio effects of a bundle at a hit point.
class EffectPlayer {
public:
	EffectPlayer( EffectInstancePool *pool, RandomGenerator *rng );

	/// Returns the number of spawned instances.
	/// The weight scales volumes of sounds and is expected to be within (0, 1].
	[[nodiscard]]
	auto play( const SurfaceEffectBundle &bundle, const float *hitPoint, const float *hitNormal, float weight ) -> unsigned;

	[[nodiscard]]
	auto getSoundRateLimiter() -> ImpactSoundRateLimiter & { return m_soundRateLimiter; }
private:
	[[nodiscard]]
	bool spawnVisualEffect( const VisualSpawnDirective &directive, const float *hitPoint,
							const float *unitNormal, const mat3_t alignedAxis );
	[[nodiscard]]
	bool spawnSoundEffect( const AudioSpawnDirective &directive, const float *hitPoint, float weight );

	EffectInstancePool *const m_pool;
	RandomGenerator *const m_rng;
	ImpactSoundRateLimiter m_soundRateLimiter;
};

}

#endif
