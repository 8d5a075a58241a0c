#ifndef SFX_d5f6f3e2_a51c_4834_8622_47e69fa7243c_H
#define SFX_d5f6f3e2_a51c_4834_8622_47e69fa7243c_H

#include "../common/sfxstringview.h"

#include <cstdint>
#include <optional>
#include <span>
#include <variant>

namespace sfx {

// Views of scene data supplied by the host. The library never retains them beyond a call.

/// A heightfield terrain blended from several texture layers.
/// The Z axis is assumed to be the up axis.
struct TerrainSurfaceData {
	// The world position of the minimal corner of the footprint
	float origin[3] { 0.0f, 0.0f, 0.0f };
	// The footprint size along X and Y
	float size[2] { 0.0f, 0.0f };
	unsigned alphaMapWidth { 0 };
	unsigned alphaMapHeight { 0 };
	// Empty names are treated as missing textures
	std::span<const sfx::StringView> layerTextures;
	// Layer weights of cells, row-major by Y, then by X, then by layer
	std::span<const float> alphaMap;
};

struct MeshRegion {
	// Vertex index triples of triangles of the region
	std::span<const uint32_t> triangleIndices;
	std::optional<sfx::StringView> texture;
};

struct MeshSurfaceData {
	// Used for diagnostics
	sfx::StringView name;
	// Vertex index triples of all triangles. An empty list means that geometry data is not available.
	std::span<const uint32_t> triangleIndices;
	std::span<const MeshRegion> regions;
	std::optional<sfx::StringView> primaryTexture;
};

using ImpactTarget = std::variant<std::monostate, const TerrainSurfaceData *, const MeshSurfaceData *>;

}

#endif
