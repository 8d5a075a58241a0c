#ifndef SFX_de6141f2_1463_4ba8_bc46_c6ae07ba4fab_H
#define SFX_de6141f2_1463_4ba8_bc46_c6ae07ba4fab_H

#include "impactkind.h"
#include "surfacedata.h"
#include "surfaceresolver.h"

#include <vector>

namespace sfx {

class MaterialRegistry;
class EffectPlayer;

/// Resolves the surface at an impact point and plays effects of matching material profiles.
/// Collaborators must outlive the dispatcher.
class ImpactDispatcher {
public:
	ImpactDispatcher( const MaterialRegistry *registry, const GeometrySurfaceResolver *resolver, EffectPlayer *player )
		: m_registry( registry ), m_resolver( resolver ), m_player( player ) {}

	/// Returns the number of spawned effect instances.
	/// The triangle index is only meaningful for mesh targets.
	[[nodiscard]]
	auto handleImpact( const ImpactTarget &target, const float *hitPoint, const float *hitNormal,
					   ImpactKind impactKind, unsigned triangleIndex = 0 ) -> unsigned;
private:
	[[nodiscard]]
	auto playForContribution( const ContributingTexture &contribution, const float *hitPoint,
							  const float *hitNormal, ImpactKind impactKind ) -> unsigned;

	const MaterialRegistry *const m_registry;
	const GeometrySurfaceResolver *const m_resolver;
	EffectPlayer *const m_player;

	// Reused between calls to avoid allocations
	std::vector<ContributingTexture> m_contributions;
};

}

#endif
