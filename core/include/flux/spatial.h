#pragma once

/**
 * @file spatial.h
 * @brief Uniform grid for bounded-radius neighbor queries
 *
 * The grid covers a cube of R cells per axis centered on the origin. Each
 * frame the particles are counted per cell, the counts are prefix-summed
 * into cell_offsets (R^3 + 1 entries, the last one holding the total) and
 * particle indices are scattered into sorted_indices in ascending cell
 * order. Positions outside the grid clamp into the boundary cells.
 *
 * GridGeometry mirrors the WGSL cell math on the host.
 */

#include <flux/error.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace flux {

class ParticleLayout;

/// Largest grid resolution per axis
constexpr uint32_t MAX_GRID_RESOLUTION = 128;

/// Threads per workgroup of the prefix-sum passes
constexpr uint32_t SCAN_BLOCK_SIZE = 256;

struct SpatialConfig {
    float cellSize = 0.1f;
    uint32_t resolution = 0;    ///< 0 = derive from bounds
    uint32_t maxNeighbors = 0;  ///< 0 = unlimited
};

/// @brief Cells per axis: enough to cover [-bounds, bounds], at least the requested value
uint32_t gridResolution(const SpatialConfig& config, float bounds);

/// @brief Cell size must be positive and no smaller than @p maxRadius
std::optional<BuildError> validateSpatial(const SpatialConfig& config, float maxRadius);

struct GridGeometry {
    float cellSize = 0.1f;
    uint32_t resolution = 1;

    static GridGeometry from(const SpatialConfig& config, float bounds);

    uint32_t numCells() const { return resolution * resolution * resolution; }
    glm::ivec3 cellCoord(const glm::vec3& position) const;
    uint32_t cellIndex(const glm::ivec3& coord) const;
    uint32_t cellIndex(const glm::vec3& position) const { return cellIndex(cellCoord(position)); }
};

/// Byte size of the GridParams uniform
constexpr uint32_t GRID_PARAMS_SIZE = 16;

/// GridParams uniform contents in GPU byte order
struct GridParamsData {
    float cellSize;
    uint32_t resolution;
    uint32_t numParticles;
    uint32_t numCells;
};
static_assert(sizeof(GridParamsData) == GRID_PARAMS_SIZE, "GridParams must be 16 bytes");

// =============================================================================
// WGSL
// =============================================================================

/// GridParams struct plus grid_cell_coord / grid_cell_index (expects a `grid` uniform)
std::string gridHelpersWgsl();

/// @brief Bindings read by the simulate program
///
/// binding 0 = grid params, 1 = sorted_indices, 2 = cell_offsets
std::string gridBindingsWgsl(uint32_t group);

/**
 * @brief Neighbor iteration over the 27 cells around the particle
 *
 * Declares `other`, `other_idx`, `neighbor_dist` and `neighbor_dir` around
 * @p body. The particle itself and dead neighbors are skipped, as are
 * neighbors at or beyond @p radiusExpr.
 */
std::string neighborLoopWgsl(const std::string& radiusExpr, const std::string& body,
                             uint32_t maxNeighbors);

/// Counting pass program (entry point grid_count)
std::string gridCountProgram(const ParticleLayout& layout);

/// Scatter pass program (entry point grid_scatter)
std::string gridScatterProgram(const ParticleLayout& layout);

/// Exclusive scan of 256-element blocks (entry point scan_blocks)
std::string gridScanProgram();

/// Adds scanned block totals back into each block (entry point add_block_offsets)
std::string gridAddOffsetsProgram();

} // namespace flux
