#ifndef SFX_310dcb78_cee9_4575_b090_ec7612f0d216_H
#define SFX_310dcb78_cee9_4575_b090_ec7612f0d216_H

#include "surfacedata.h"

#include <vector>

namespace sfx {

struct ContributingTexture {
	// Absent if the struck geometry has no texture reference
	std::optional<sfx::StringView> texture;
	float weight { 1.0f };
};

/// Determines textures that contribute to the surface at a hit point.
class GeometrySurfaceResolver {
public:
	/// Appends textures of terrain layers with positive weights at the hit point.
	/// Returns false if the hit point could not be mapped to a cell of the alpha map.
	[[nodiscard]]
	bool resolveTerrain( const TerrainSurfaceData &terrain, const float *hitPoint,
						 std::vector<ContributingTexture> *contributions ) const;

	/// Appends a single texture of the region which contains the hit triangle.
	/// Returns false if the mesh lacks geometry data.
	[[nodiscard]]
	bool resolveMesh( const MeshSurfaceData &mesh, unsigned triangleIndex,
					  std::vector<ContributingTexture> *contributions ) const;
};

}

#endif
