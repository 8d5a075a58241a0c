#include "impactdispatcher.h"
#include "effectplayer.h"
#include "materialregistry.h"
#include "surfacevars.h"
#include "../common/outputmessages.h"

namespace sfx {

auto ImpactDispatcher::handleImpact( const ImpactTarget &target, const float *hitPoint, const float *hitNormal,
									 ImpactKind impactKind, unsigned triangleIndex ) -> unsigned {
	m_contributions.clear();

	bool resolved = false;
	if( const auto *terrain = std::get_if<const TerrainSurfaceData *>( &target ); terrain && *terrain ) {
		resolved = m_resolver->resolveTerrain( **terrain, hitPoint, &m_contributions );
	} else if( const auto *mesh = std::get_if<const MeshSurfaceData *>( &target ); mesh && *mesh ) {
		resolved = m_resolver->resolveMesh( **mesh, triangleIndex, &m_contributions );
	} else {
		if( v_warnOnUnsupportedTargets.get() ) {
			surfWarning() << "An impact of kind" << getImpactKindName( impactKind ) << "has no supported target";
		}
		return 0;
	}

	if( !resolved || m_contributions.empty() ) {
		m_contributions.clear();
		m_contributions.emplace_back( ContributingTexture { .texture = std::nullopt, .weight = 1.0f } );
	}

	unsigned numSpawnedInstances = 0;
	for( const ContributingTexture &contribution: m_contributions ) {
		numSpawnedInstances += playForContribution( contribution, hitPoint, hitNormal, impactKind );
	}
	return numSpawnedInstances;
}

auto ImpactDispatcher::playForContribution( const ContributingTexture &contribution, const float *hitPoint,
											const float *hitNormal, ImpactKind impactKind ) -> unsigned {
	const MaterialProfile &profile = m_registry->resolveOrDefault( contribution.texture );
	const SurfaceEffectBundle *bundle = profile.findBundleForImpact( impactKind );

	unsigned numSpawnedInstances = 0;
	if( bundle ) {
		numSpawnedInstances = m_player->play( *bundle, hitPoint, hitNormal, contribution.weight );
	}

	if( v_debugImpacts.get() ) {
		surfDebug() << "Impact" << getImpactKindName( impactKind ) << "at" << hitPoint[0] << hitPoint[1] << hitPoint[2]
			<< "texture" << contribution.texture.value_or( sfx::StringView( "<none>" ) ) << "weight" << contribution.weight
			<< "profile" << profile.name << "spawned" << numSpawnedInstances;
	}

	return numSpawnedInstances;
}

}
