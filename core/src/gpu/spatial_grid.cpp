// Flux - Spatial Grid Implementation

#include <flux/gpu/spatial_grid.h>
#include <flux/gpu/gpu_common.h>
#include <iostream>

namespace flux::gpu {

namespace {

struct ScanParamsData {
    uint32_t count;
    uint32_t numBlocks;
    uint32_t pad0;
    uint32_t pad1;
};

const WGPUBufferUsage STORAGE_CLEARABLE = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst;
const WGPUBufferUsage STORAGE_READABLE = WGPUBufferUsage_Storage | WGPUBufferUsage_CopySrc;

} // namespace

std::unique_ptr<SpatialGrid> SpatialGrid::create(WGPUDevice device, WGPUQueue queue,
                                                 const ParticleLayout& layout,
                                                 const SpatialConfig& config, float bounds,
                                                 uint32_t particleCount,
                                                 WGPUBuffer particlesA, WGPUBuffer particlesB,
                                                 BuildError* error) {
    std::unique_ptr<SpatialGrid> grid(new SpatialGrid());
    grid->m_geometry = GridGeometry::from(config, bounds);
    grid->m_particleCount = particleCount;

    const uint32_t numCells = grid->m_geometry.numCells();
    const uint64_t cellBytes = uint64_t(numCells + 1) * sizeof(uint32_t);
    const uint64_t indexBytes = uint64_t(particleCount) * sizeof(uint32_t);

    grid->m_params.reset(createBuffer(device, GRID_PARAMS_SIZE,
                                      WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst, "Grid Params"));
    grid->m_cellCounts.reset(createBuffer(device, cellBytes, STORAGE_CLEARABLE | WGPUBufferUsage_CopySrc,
                                          "Grid Cell Counts"));
    grid->m_cellOffsets.reset(createBuffer(device, cellBytes, STORAGE_READABLE, "Grid Cell Offsets"));
    grid->m_cellNext.reset(createBuffer(device, cellBytes, STORAGE_CLEARABLE, "Grid Cell Next"));
    grid->m_sortedIndices.reset(createBuffer(device, indexBytes, STORAGE_READABLE, "Grid Sorted Indices"));

    if (!grid->m_params || !grid->m_cellCounts || !grid->m_cellOffsets ||
        !grid->m_cellNext || !grid->m_sortedIndices) {
        std::cerr << "[SpatialGrid] Failed to allocate grid buffers for " << numCells << " cells\n";
        if (error) *error = makeError(ErrorKind::Device, "grid buffer allocation failed");
        return nullptr;
    }

    GridParamsData params = {grid->m_geometry.cellSize, grid->m_geometry.resolution,
                             particleCount, numCells};
    wgpuQueueWriteBuffer(queue, grid->m_params, 0, &params, sizeof(params));

    // Programs
    grid->m_count = PipelineBuilder(device)
        .shader(gridCountProgram(layout), "grid_count")
        .entry("grid_count")
        .readOnlyStorage(0)
        .uniform(1, GRID_PARAMS_SIZE)
        .storage(2)
        .buildCompute(error);
    if (!grid->m_count) return nullptr;

    grid->m_scatter = PipelineBuilder(device)
        .shader(gridScatterProgram(layout), "grid_scatter")
        .entry("grid_scatter")
        .readOnlyStorage(0)
        .uniform(1, GRID_PARAMS_SIZE)
        .readOnlyStorage(2)
        .storage(3)
        .storage(4)
        .buildCompute(error);
    if (!grid->m_scatter) return nullptr;

    grid->m_scan = PipelineBuilder(device)
        .shader(gridScanProgram(), "scan_blocks")
        .entry("scan_blocks")
        .uniform(0, sizeof(ScanParamsData))
        .readOnlyStorage(1)
        .storage(2)
        .storage(3)
        .buildCompute(error);
    if (!grid->m_scan) return nullptr;

    grid->m_addOffsets = PipelineBuilder(device)
        .shader(gridAddOffsetsProgram(), "add_block_offsets")
        .entry("add_block_offsets")
        .uniform(0, sizeof(ScanParamsData))
        .readOnlyStorage(1)
        .storage(2)
        .buildCompute(error);
    if (!grid->m_addOffsets) return nullptr;

    // Bind groups for both read parities
    WGPUBuffer particles[2] = {particlesA, particlesB};
    for (uint32_t parity = 0; parity < 2; ++parity) {
        grid->m_countGroups[parity] = BindGroupBuilder(device, grid->m_count->layout())
            .buffer(0, particles[parity])
            .buffer(1, grid->m_params, GRID_PARAMS_SIZE)
            .buffer(2, grid->m_cellCounts)
            .build("Grid Count");
        grid->m_scatterGroups[parity] = BindGroupBuilder(device, grid->m_scatter->layout())
            .buffer(0, particles[parity])
            .buffer(1, grid->m_params, GRID_PARAMS_SIZE)
            .buffer(2, grid->m_cellOffsets)
            .buffer(3, grid->m_cellNext)
            .buffer(4, grid->m_sortedIndices)
            .build("Grid Scatter");
    }

    if (!grid->createScanLevels(device, queue)) {
        if (error) *error = makeError(ErrorKind::Device, "grid scan buffer allocation failed");
        return nullptr;
    }

    std::cout << "[SpatialGrid] " << grid->m_geometry.resolution << "^3 cells, cell size "
              << grid->m_geometry.cellSize << ", " << grid->m_levels.size() << " scan level(s)\n";
    return grid;
}

bool SpatialGrid::createScanLevels(WGPUDevice device, WGPUQueue queue) {
    m_levels.clear();

    uint32_t count = m_geometry.numCells() + 1;
    while (true) {
        ScanLevel level;
        level.count = count;
        level.numBlocks = (count + SCAN_BLOCK_SIZE - 1) / SCAN_BLOCK_SIZE;
        level.params.reset(createBuffer(device, sizeof(ScanParamsData),
                                        WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst, "Scan Params"));
        level.blockSums.reset(createBuffer(device, uint64_t(level.numBlocks) * sizeof(uint32_t),
                                          WGPUBufferUsage_Storage, "Scan Block Sums"));
        if (!m_levels.empty()) {
            level.scanned.reset(createBuffer(device, uint64_t(count) * sizeof(uint32_t),
                                             WGPUBufferUsage_Storage, "Scan Block Offsets"));
        }
        if (!level.params || !level.blockSums || (!m_levels.empty() && !level.scanned)) {
            std::cerr << "[SpatialGrid] Failed to allocate scan level " << m_levels.size() << "\n";
            return false;
        }

        ScanParamsData data = {level.count, level.numBlocks, 0, 0};
        wgpuQueueWriteBuffer(queue, level.params, 0, &data, sizeof(data));

        uint32_t blocks = level.numBlocks;
        m_levels.push_back(std::move(level));
        if (blocks <= 1) break;
        count = blocks;
    }

    for (size_t k = 0; k < m_levels.size(); ++k) {
        ScanLevel& level = m_levels[k];
        WGPUBuffer input = k == 0 ? m_cellCounts.get() : m_levels[k - 1].blockSums.get();
        WGPUBuffer output = k == 0 ? m_cellOffsets.get() : level.scanned.get();

        level.scanGroup = BindGroupBuilder(device, m_scan->layout())
            .buffer(0, level.params, sizeof(ScanParamsData))
            .buffer(1, input)
            .buffer(2, output)
            .buffer(3, level.blockSums)
            .build("Scan Blocks");

        if (k + 1 < m_levels.size()) {
            level.addGroup = BindGroupBuilder(device, m_addOffsets->layout())
                .buffer(0, level.params, sizeof(ScanParamsData))
                .buffer(1, m_levels[k + 1].scanned)
                .buffer(2, output)
                .build("Scan Add Offsets");
        }
    }
    return true;
}

void SpatialGrid::encode(WGPUCommandEncoder encoder, uint32_t readIndex) {
    const uint32_t parity = readIndex & 1u;
    const uint64_t cellBytes = uint64_t(numCells() + 1) * sizeof(uint32_t);
    wgpuCommandEncoderClearBuffer(encoder, m_cellCounts, 0, cellBytes);
    wgpuCommandEncoderClearBuffer(encoder, m_cellNext, 0, cellBytes);

    WGPUComputePassDescriptor passDesc = {};
    passDesc.label = toStringView("Spatial Grid");
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);

    wgpuComputePassEncoderSetPipeline(pass, m_count->pipeline());
    wgpuComputePassEncoderSetBindGroup(pass, 0, m_countGroups[parity], 0, nullptr);
    dispatch(pass, m_particleCount);

    // Scan up the levels, then propagate block offsets back down
    wgpuComputePassEncoderSetPipeline(pass, m_scan->pipeline());
    for (const ScanLevel& level : m_levels) {
        wgpuComputePassEncoderSetBindGroup(pass, 0, level.scanGroup, 0, nullptr);
        dispatch(pass, level.count, SCAN_BLOCK_SIZE);
    }
    if (m_levels.size() > 1) {
        wgpuComputePassEncoderSetPipeline(pass, m_addOffsets->pipeline());
        for (size_t k = m_levels.size() - 1; k-- > 0;) {
            wgpuComputePassEncoderSetBindGroup(pass, 0, m_levels[k].addGroup, 0, nullptr);
            dispatch(pass, m_levels[k].count, SCAN_BLOCK_SIZE);
        }
    }

    wgpuComputePassEncoderSetPipeline(pass, m_scatter->pipeline());
    wgpuComputePassEncoderSetBindGroup(pass, 0, m_scatterGroups[parity], 0, nullptr);
    dispatch(pass, m_particleCount);

    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);
}

} // namespace flux::gpu
