#pragma once

/**
 * @file spatial_grid.h
 * @brief GPU counting sort of particles into grid cells
 *
 * Per frame, inside one compute pass:
 * 1. count particles per cell (atomic)
 * 2. exclusive scan of the counts into cell_offsets, one level per 256x
 *    reduction, then block totals added back down the levels
 * 3. scatter particle indices into sorted_indices
 *
 * cell_counts and cell_next are cleared with copy-encoder clears before the
 * pass. The simulate program then reads grid params, sorted_indices and
 * cell_offsets through the bind group from simulateBindGroup().
 */

#include <flux/error.h>
#include <flux/gpu/gpu_handle.h>
#include <flux/gpu/pipeline_builder.h>
#include <flux/layout.h>
#include <flux/spatial.h>
#include <webgpu/webgpu.h>
#include <memory>
#include <optional>
#include <vector>

namespace flux::gpu {

class SpatialGrid {
public:
    /**
     * @brief Allocate grid buffers and build the four grid programs
     * @param particles Both ping-pong particle buffers
     */
    static std::unique_ptr<SpatialGrid> create(WGPUDevice device, WGPUQueue queue,
                                               const ParticleLayout& layout,
                                               const SpatialConfig& config, float bounds,
                                               uint32_t particleCount,
                                               WGPUBuffer particlesA, WGPUBuffer particlesB,
                                               BuildError* error = nullptr);

    /// @brief Record clears and grid passes sorting the buffer of parity @p readIndex
    void encode(WGPUCommandEncoder encoder, uint32_t readIndex);

    const GridGeometry& geometry() const { return m_geometry; }
    uint32_t numCells() const { return m_geometry.numCells(); }

    WGPUBuffer params() const { return m_params; }
    WGPUBuffer sortedIndices() const { return m_sortedIndices; }
    WGPUBuffer cellOffsets() const { return m_cellOffsets; }

    /// Scan levels used for R^3 + 1 entries
    size_t scanLevels() const { return m_levels.size(); }

private:
    struct ScanLevel {
        uint32_t count = 0;
        uint32_t numBlocks = 0;
        BufferHandle params;
        BufferHandle blockSums;  ///< One total per block
        BufferHandle scanned;    ///< Scan output; level 0 writes cell_offsets instead
        BindGroupHandle scanGroup;
        BindGroupHandle addGroup;
    };

    SpatialGrid() = default;

    bool createScanLevels(WGPUDevice device, WGPUQueue queue);

    GridGeometry m_geometry;
    uint32_t m_particleCount = 0;

    BufferHandle m_params;
    BufferHandle m_cellCounts;
    BufferHandle m_cellOffsets;
    BufferHandle m_cellNext;
    BufferHandle m_sortedIndices;

    std::optional<ComputeProgram> m_count;
    std::optional<ComputeProgram> m_scatter;
    std::optional<ComputeProgram> m_scan;
    std::optional<ComputeProgram> m_addOffsets;

    BindGroupHandle m_countGroups[2];
    BindGroupHandle m_scatterGroups[2];
    std::vector<ScanLevel> m_levels;
};

} // namespace flux::gpu
