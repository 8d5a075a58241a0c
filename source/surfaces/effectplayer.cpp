#include "effectplayer.h"
#include "effectpool.h"
#include "surfacevars.h"
#include "../common/outputmessages.h"
#include "../common/sfxbasicmath.h"
#include "../common/sfxexceptions.h"

#include <cmath>
#include <limits>
#include <memory>

namespace sfx {

ImpactSoundRateLimiter::ImpactSoundRateLimiter( RandomGenerator *rng, const Params &params )
	: m_rng( rng ), m_params( params ) {
	if( !( params.startDroppingAtDistance > 0.0f ) || !params.startDroppingAtTimeDiff ) {
		sfx::failWithInvalidArgument( "The rate limiter thresholds must be positive" );
	}
}

void ImpactSoundRateLimiter::clear() {
	m_groupEntries.clear();
}

bool ImpactSoundRateLimiter::acquirePermission( int64_t timestamp, const float *origin, const sfx::StringView &group ) {
	for( GroupEntry &entry: m_groupEntries ) {
		if( sfx::StringView( entry.group.data(), entry.group.size() ).equals( group ) ) {
			return entry.limiter.acquirePermission( timestamp, origin, m_params, m_rng );
		}
	}

	GroupEntry *chosenEntry = nullptr;
	if( !m_groupEntries.full() ) {
		chosenEntry = &m_groupEntries.emplace_back();
	} else {
		// Evict the group which was not used for the longest time
		int64_t oldestTimestamp = std::numeric_limits<int64_t>::max();
		for( GroupEntry &entry: m_groupEntries ) {
			if( std::optional<int64_t> maybeTimestamp = entry.limiter.getLastTimestamp() ) {
				if( *maybeTimestamp < oldestTimestamp ) {
					oldestTimestamp = *maybeTimestamp;
					chosenEntry     = std::addressof( entry );
				}
			} else {
				chosenEntry = std::addressof( entry );
				break;
			}
		}
		chosenEntry->limiter.clear();
	}

	chosenEntry->group.assign( group.data(), group.size() );
	return chosenEntry->limiter.acquirePermission( timestamp, origin, m_params, m_rng );
}

bool ImpactSoundRateLimiter::GroupLimiter::acquirePermission( int64_t timestamp, const float *origin,
															  const Params &params, RandomGenerator *rng ) {
	int64_t closestTimestamp    = std::numeric_limits<int64_t>::min();
	float closestSquareDistance = std::numeric_limits<float>::max();

	const float squareDistanceThreshold = sfx::square( params.startDroppingAtDistance );
	const int64_t minTimestampThreshold = timestamp - params.startDroppingAtTimeDiff;
	for( const Entry &entry: m_entries ) {
		// Entries from the future may appear if the host time goes backwards
		if( entry.timestamp >= minTimestampThreshold && entry.timestamp <= timestamp ) {
			const float squareDistance = DistanceSquared( origin, entry.origin );
			if( squareDistance < squareDistanceThreshold ) {
				closestSquareDistance = sfx::min( squareDistance, closestSquareDistance );
				closestTimestamp      = sfx::max( entry.timestamp, closestTimestamp );
			}
		}
	}

	bool result = true;
	if( closestSquareDistance < squareDistanceThreshold ) {
		const float distance     = std::sqrt( closestSquareDistance );
		const float distanceFrac = sfx::clamp( distance / params.startDroppingAtDistance, 0.0f, 1.0f );

		const int64_t timeDiff = timestamp - closestTimestamp;
		const float timeFrac   = sfx::clamp( (float)timeDiff / (float)params.startDroppingAtTimeDiff, 0.0f, 1.0f );

		const float dropByDistanceChance = params.dropChanceAtZeroDistance * ( 1.0f - distanceFrac );
		const float dropByTimeDiffChance = params.dropChanceAtZeroTimeDiff * ( 1.0f - timeFrac );

		const float keepByDistanceChance = 1.0f - dropByDistanceChance;
		const float keepByTimeDiffChance = 1.0f - dropByTimeDiffChance;
		const float combinedKeepChance   = sfx::clamp( keepByDistanceChance * keepByTimeDiffChance, 0.0f, 1.0f );

		result = rng->tryWithChance( combinedKeepChance );
	}

	if( result ) {
		if( m_entries.full() ) {
			m_entries.pop_front();
		}
		m_entries.emplace_back( Entry { .timestamp = timestamp, .origin = { origin[0], origin[1], origin[2] } } );
	}

	return result;
}

EffectPlayer::EffectPlayer( EffectInstancePool *pool, RandomGenerator *rng )
	: m_pool( pool ), m_rng( rng ), m_soundRateLimiter( rng ) {}

auto EffectPlayer::play( const SurfaceEffectBundle &bundle, const float *hitPoint,
						 const float *hitNormal, float weight ) -> unsigned {
	unsigned numSpawnedInstances = 0;

	if( !bundle.visuals.empty() ) {
		mat3_t alignedAxis;
		vec3_t normalizedNormal { hitNormal[0], hitNormal[1], hitNormal[2] };
		if( VectorNormalize( normalizedNormal ) > 0.0f ) [[likely]] {
			NormalVectorToUpAxis( normalizedNormal, alignedAxis );
		} else {
			fxDebug() << "The hit normal is degenerate, keeping the default orientation";
			Matrix3_Identity( alignedAxis );
		}

		for( const VisualSpawnDirective &directive: bundle.visuals ) {
			if( spawnVisualEffect( directive, hitPoint, normalizedNormal, alignedAxis ) ) {
				numSpawnedInstances++;
			}
		}
	}

	for( const AudioSpawnDirective &directive: bundle.sounds ) {
		if( spawnSoundEffect( directive, hitPoint, weight ) ) {
			numSpawnedInstances++;
		}
	}

	return numSpawnedInstances;
}

bool EffectPlayer::spawnVisualEffect( const VisualSpawnDirective &directive, const float *hitPoint,
									  const float *unitNormal, const mat3_t alignedAxis ) {
	// Note: Zero probability never passes, the probability of 1 always does
	if( !m_rng->tryWithChance( directive.probability ) ) {
		return false;
	}

	PooledEffectInstance *const instance = m_pool->acquire( sfx::StringView( directive.prefab.data(), directive.prefab.size() ),
															v_effectPoolSize.get() );

	vec3_t origin;
	VectorMA( hitPoint, v_surfaceOffset.get(), unitNormal, origin );

	if( !directive.randomizeRotation ) {
		instance->activate( origin, alignedAxis );
	} else {
		vec3_t angles;
		for( unsigned i = 0; i < 3; ++i ) {
			const float bound = 180.0f * directive.rotationMultiplier[i];
			angles[i] = m_rng->nextFloat( sfx::min( 0.0f, bound ), sfx::max( 0.0f, bound ) );
		}
		mat3_t localRotation, resultAxis;
		Matrix3_FromAngles( angles, localRotation );
		// Apply the random rotation in the frame of the aligned axis
		Matrix3_Multiply( localRotation, alignedAxis, resultAxis );
		instance->activate( origin, resultAxis );
	}

	return true;
}

bool EffectPlayer::spawnSoundEffect( const AudioSpawnDirective &directive, const float *hitPoint, float weight ) {
	if( directive.clips.empty() ) [[unlikely]] {
		return false;
	}

	const AudioClip &clip = directive.clips[m_rng->nextBounded( (unsigned)directive.clips.size() )];
	const sfx::StringView emitterPrefab( directive.emitterPrefab.data(), directive.emitterPrefab.size() );

	if( v_limitImpactSounds.get() ) {
		if( !m_soundRateLimiter.acquirePermission( m_pool->getCurrentTime(), hitPoint, emitterPrefab ) ) {
			if( v_debugImpacts.get() ) {
				fxDebug() << "Dropping the impact sound" << clip.name << "of" << emitterPrefab;
			}
			return false;
		}
	}

	const float volume = weight * m_rng->nextFloat( directive.minVolume, directive.maxVolume );

	mat3_t axis;
	Matrix3_Identity( axis );

	PooledEffectInstance *const instance = m_pool->acquire( emitterPrefab, v_effectPoolSize.get() );
	instance->activate( hitPoint, axis );
	instance->startSound( sfx::StringView( clip.name.data(), clip.name.size() ), volume );
	instance->deactivateAfter( clip.durationMillis );

	return true;
}

}
