#include "surfaceresolver.h"
#include "surfacevars.h"
#include "../common/outputmessages.h"

#include <algorithm>
#include <cmath>

namespace sfx {

[[nodiscard]]
static auto findCellIndex( float normalizedCoord, unsigned resolution, TerrainOutOfRangePolicy policy )
	-> std::optional<unsigned> {
	const double scaledCoord = std::floor( (double)normalizedCoord * (double)resolution );
	if( !std::isfinite( scaledCoord ) ) [[unlikely]] {
		return std::nullopt;
	}
	if( scaledCoord >= 0.0 && scaledCoord < (double)resolution ) [[likely]] {
		return (unsigned)scaledCoord;
	}
	if( policy == TerrainOutOfRangePolicy::Clamp ) {
		return scaledCoord < 0.0 ? 0u : resolution - 1u;
	}
	return std::nullopt;
}

bool GeometrySurfaceResolver::resolveTerrain( const TerrainSurfaceData &terrain, const float *hitPoint,
											  std::vector<ContributingTexture> *contributions ) const {
	const size_t numLayers = terrain.layerTextures.size();
	const size_t numCells  = (size_t)terrain.alphaMapWidth * (size_t)terrain.alphaMapHeight;
	// Note: the negated comparison catches NaN values as well
	if( !( terrain.size[0] > 0.0f && terrain.size[1] > 0.0f ) || !numCells || !numLayers ) [[unlikely]] {
		surfError() << "Degenerate terrain data: size" << terrain.size[0] << terrain.size[1]
			<< "alpha map resolution" << terrain.alphaMapWidth << terrain.alphaMapHeight << "layers" << (uint64_t)numLayers;
		return false;
	}
	if( terrain.alphaMap.size() < numCells * numLayers ) [[unlikely]] {
		surfError() << "The terrain alpha map has" << (uint64_t)terrain.alphaMap.size() << "values while"
			<< (uint64_t)( numCells * numLayers ) << "are expected";
		return false;
	}

	const float normalizedX = ( hitPoint[0] - terrain.origin[0] ) / terrain.size[0];
	const float normalizedY = ( hitPoint[1] - terrain.origin[1] ) / terrain.size[1];

	const TerrainOutOfRangePolicy policy = v_terrainOutOfRangePolicy.get();
	const std::optional<unsigned> maybeCellX = findCellIndex( normalizedX, terrain.alphaMapWidth, policy );
	const std::optional<unsigned> maybeCellY = findCellIndex( normalizedY, terrain.alphaMapHeight, policy );
	if( !maybeCellX || !maybeCellY ) {
		if( v_debugImpacts.get() ) {
			surfDebug() << "The terrain hit point" << hitPoint[0] << hitPoint[1] << "is outside of the alpha map";
		}
		return false;
	}

	const size_t cellIndex   = (size_t)*maybeCellY * terrain.alphaMapWidth + *maybeCellX;
	const float *cellWeights = terrain.alphaMap.data() + cellIndex * numLayers;
	for( size_t layerIndex = 0; layerIndex < numLayers; ++layerIndex ) {
		if( const float weight = cellWeights[layerIndex]; weight > 0.0f ) {
			std::optional<sfx::StringView> texture;
			if( !terrain.layerTextures[layerIndex].empty() ) {
				texture = terrain.layerTextures[layerIndex];
			}
			contributions->emplace_back( ContributingTexture { .texture = texture, .weight = std::min( weight, 1.0f ) } );
		}
	}

	return true;
}

[[nodiscard]]
static bool regionContainsTriangle( const MeshRegion &region, const uint32_t *triangle, bool canonical ) {
	const uint32_t *const regionIndices = region.triangleIndices.data();
	const size_t numRegionIndices       = region.triangleIndices.size() - region.triangleIndices.size() % 3;
	if( !canonical ) {
		for( size_t i = 0; i < numRegionIndices; i += 3 ) {
			if( regionIndices[i + 0] == triangle[0] && regionIndices[i + 1] == triangle[1] && regionIndices[i + 2] == triangle[2] ) {
				return true;
			}
		}
	} else {
		uint32_t sortedTriangle[3] { triangle[0], triangle[1], triangle[2] };
		std::sort( std::begin( sortedTriangle ), std::end( sortedTriangle ) );
		for( size_t i = 0; i < numRegionIndices; i += 3 ) {
			uint32_t sortedRegionTriangle[3] { regionIndices[i + 0], regionIndices[i + 1], regionIndices[i + 2] };
			std::sort( std::begin( sortedRegionTriangle ), std::end( sortedRegionTriangle ) );
			if( std::equal( std::begin( sortedTriangle ), std::end( sortedTriangle ), std::begin( sortedRegionTriangle ) ) ) {
				return true;
			}
		}
	}
	return false;
}

bool GeometrySurfaceResolver::resolveMesh( const MeshSurfaceData &mesh, unsigned triangleIndex,
										   std::vector<ContributingTexture> *contributions ) const {
	if( mesh.triangleIndices.empty() ) [[unlikely]] {
		surfError() << "The mesh" << mesh.name << "has no geometry data, using the default material";
		return false;
	}

	std::optional<sfx::StringView> texture = mesh.primaryTexture;
	if( mesh.regions.size() > 1 ) {
		const size_t firstIndexOfTriangle = 3 * (size_t)triangleIndex;
		if( firstIndexOfTriangle + 3 <= mesh.triangleIndices.size() ) [[likely]] {
			const uint32_t *const triangle = mesh.triangleIndices.data() + firstIndexOfTriangle;
			const bool canonical = v_canonicalTriangleMatch.get();
			for( const MeshRegion &region: mesh.regions ) {
				if( regionContainsTriangle( region, triangle, canonical ) ) {
					texture = region.texture;
					break;
				}
			}
		} else {
			surfWarning() << "The triangle index" << triangleIndex << "is out of range for the mesh" << mesh.name;
		}
	}

	contributions->emplace_back( ContributingTexture { .texture = texture, .weight = 1.0f } );
	return true;
}

}
