#ifndef SFX_29c97fd7_e412_442b_8fc1_164c89ecc3d0_H
#define SFX_29c97fd7_e412_442b_8fc1_164c89ecc3d0_H

#include "impactkind.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sfx {

struct AudioClip {
	std::string name;
	unsigned durationMillis { 0 };
};

struct VisualSpawnDirective {
	std::string prefab;
	float probability { 1.0f };
	bool randomizeRotation { false };
	// Scales the upper bound of the random angle (180 degrees) for pitch, yaw and roll respectively
	float rotationMultiplier[3] { 1.0f, 1.0f, 1.0f };
};

struct AudioSpawnDirective {
	std::string emitterPrefab;
	std::vector<AudioClip> clips;
	float minVolume { 1.0f };
	float maxVolume { 1.0f };
};

struct SurfaceEffectBundle {
	std::vector<VisualSpawnDirective> visuals;
	std::vector<AudioSpawnDirective> sounds;
};

/// Binds a texture to responses for impacts of different kinds.
/// Instances are owned by the host configuration and must outlive registries that refer to them.
struct MaterialProfile {
	std::string name;
	std::string texture;
	std::vector<std::pair<ImpactKind, SurfaceEffectBundle>> effects;

	/// Returns the first bundle registered for the kind, if any.
	/// Further bundles of the same kind are unreachable.
	[[nodiscard]]
	auto findBundleForImpact( ImpactKind kind ) const -> const SurfaceEffectBundle *;

	/// Returns a description of the first found problem, if any
	[[nodiscard]]
	auto validate( bool requireTexture = true ) const -> std::optional<std::string>;
};

}

#endif
