#include "materialprofile.h"

#include <cmath>

namespace sfx {

auto MaterialProfile::findBundleForImpact( ImpactKind kind ) const -> const SurfaceEffectBundle * {
	for( const auto &[bundleKind, bundle]: effects ) {
		if( bundleKind == kind ) {
			return &bundle;
		}
	}
	return nullptr;
}

[[nodiscard]]
static auto describeDirectiveProblem( const char *kindOfDirective, ImpactKind impactKind,
									  size_t index, const char *problem ) -> std::string {
	std::string result( kindOfDirective );
	result += " directive #";
	result += std::to_string( index );
	result += " for ";
	const sfx::StringView kindName( getImpactKindName( impactKind ) );
	result.append( kindName.data(), kindName.size() );
	result += " impacts ";
	result += problem;
	return result;
}

auto MaterialProfile::validate( bool requireTexture ) const -> std::optional<std::string> {
	if( requireTexture && texture.empty() ) {
		return std::string( "The texture is not specified" );
	}
	for( const auto &[kind, bundle]: effects ) {
		for( size_t i = 0; i < bundle.visuals.size(); ++i ) {
			const VisualSpawnDirective &directive = bundle.visuals[i];
			if( directive.prefab.empty() ) {
				return describeDirectiveProblem( "A visual", kind, i, "has an empty prefab" );
			}
			// Note: this also rejects NaN values
			if( !( directive.probability >= 0.0f && directive.probability <= 1.0f ) ) {
				return describeDirectiveProblem( "A visual", kind, i, "has a probability outside of [0, 1]" );
			}
			for( const float multiplier: directive.rotationMultiplier ) {
				if( !std::isfinite( multiplier ) ) {
					return describeDirectiveProblem( "A visual", kind, i, "has an illegal rotation multiplier" );
				}
			}
		}
		for( size_t i = 0; i < bundle.sounds.size(); ++i ) {
			const AudioSpawnDirective &directive = bundle.sounds[i];
			if( directive.emitterPrefab.empty() ) {
				return describeDirectiveProblem( "An audio", kind, i, "has an empty emitter prefab" );
			}
			if( directive.clips.empty() ) {
				return describeDirectiveProblem( "An audio", kind, i, "has an empty list of clips" );
			}
			for( const AudioClip &clip: directive.clips ) {
				if( clip.name.empty() ) {
					return describeDirectiveProblem( "An audio", kind, i, "has a clip with an empty name" );
				}
				if( !clip.durationMillis ) {
					return describeDirectiveProblem( "An audio", kind, i, "has a clip with a zero duration" );
				}
			}
			// Volumes must satisfy 0 <= min <= max <= 1 (this also rejects NaN)
			if( !( directive.minVolume >= 0.0f && directive.minVolume <= directive.maxVolume && directive.maxVolume <= 1.0f ) ) {
				return describeDirectiveProblem( "An audio", kind, i, "has an illegal volume range" );
			}
		}
	}
	return std::nullopt;
}

}
