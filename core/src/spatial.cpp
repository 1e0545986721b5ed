// Flux - Spatial Grid Implementation

#include <flux/spatial.h>
#include <flux/layout.h>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace flux {

uint32_t gridResolution(const SpatialConfig& config, float bounds) {
    uint32_t needed = 1;
    if (config.cellSize > 0.0f && bounds > 0.0f) {
        needed = static_cast<uint32_t>(std::ceil(2.0f * bounds / config.cellSize));
    }
    uint32_t res = std::max(config.resolution, needed);
    return std::clamp(res, 1u, MAX_GRID_RESOLUTION);
}

std::optional<BuildError> validateSpatial(const SpatialConfig& config, float maxRadius) {
    if (!(config.cellSize > 0.0f)) {
        return makeError(ErrorKind::CellSizeTooSmall, "cell size must be positive");
    }
    if (config.cellSize < maxRadius) {
        std::ostringstream ss;
        ss << "cell size " << config.cellSize << " is smaller than the largest neighbor radius "
           << maxRadius;
        return makeError(ErrorKind::CellSizeTooSmall, ss.str());
    }
    return std::nullopt;
}

// =============================================================================
// GridGeometry
// =============================================================================

GridGeometry GridGeometry::from(const SpatialConfig& config, float bounds) {
    GridGeometry g;
    g.cellSize = config.cellSize;
    g.resolution = gridResolution(config, bounds);
    return g;
}

glm::ivec3 GridGeometry::cellCoord(const glm::vec3& position) const {
    float half = static_cast<float>(resolution) * cellSize * 0.5f;
    glm::vec3 f = glm::floor((position + glm::vec3(half)) / cellSize);
    // Clamped in float before the int cast, as in grid_cell_coord
    f = glm::clamp(f, glm::vec3(0.0f), glm::vec3(static_cast<float>(resolution - 1)));
    return glm::ivec3(f);
}

uint32_t GridGeometry::cellIndex(const glm::ivec3& c) const {
    uint32_t r = resolution;
    return static_cast<uint32_t>(c.x) + static_cast<uint32_t>(c.y) * r +
           static_cast<uint32_t>(c.z) * r * r;
}

// =============================================================================
// WGSL
// =============================================================================

std::string gridHelpersWgsl() {
    return R"(
struct GridParams {
    cell_size: f32,
    resolution: u32,
    num_particles: u32,
    num_cells: u32,
};

fn grid_cell_coord(pos: vec3<f32>) -> vec3<i32> {
    let half = f32(grid.resolution) * grid.cell_size * 0.5;
    let f = floor((pos + vec3<f32>(half)) / grid.cell_size);
    let c = clamp(f, vec3<f32>(0.0), vec3<f32>(f32(grid.resolution - 1u)));
    return vec3<i32>(c);
}

fn grid_cell_index(c: vec3<i32>) -> u32 {
    let r = grid.resolution;
    return u32(c.x) + u32(c.y) * r + u32(c.z) * r * r;
}
)";
}

std::string gridBindingsWgsl(uint32_t group) {
    std::ostringstream ss;
    ss << "@group(" << group << ") @binding(0) var<uniform> grid: GridParams;\n";
    ss << "@group(" << group << ") @binding(1) var<storage, read> sorted_indices: array<u32>;\n";
    ss << "@group(" << group << ") @binding(2) var<storage, read> cell_offsets: array<u32>;\n";
    return ss.str();
}

std::string neighborLoopWgsl(const std::string& radiusExpr, const std::string& body,
                             uint32_t maxNeighbors) {
    std::ostringstream ss;
    ss << "    {\n";
    ss << "        let nl_center = p.position;\n";
    ss << "        let nl_radius = " << radiusExpr << ";\n";
    ss << "        let nl_cell = grid_cell_coord(nl_center);\n";
    ss << "        let nl_res = i32(grid.resolution);\n";
    ss << "        var nl_count = 0u;\n";
    ss << "        for (var dz = -1; dz <= 1; dz++) {\n";
    ss << "        for (var dy = -1; dy <= 1; dy++) {\n";
    ss << "        for (var dx = -1; dx <= 1; dx++) {\n";
    ss << "            let nl_c = nl_cell + vec3<i32>(dx, dy, dz);\n";
    ss << "            if (any(nl_c < vec3<i32>(0)) || any(nl_c >= vec3<i32>(nl_res))) {\n";
    ss << "                continue;\n";
    ss << "            }\n";
    ss << "            let nl_idx = grid_cell_index(nl_c);\n";
    ss << "            let nl_start = cell_offsets[nl_idx];\n";
    ss << "            let nl_end = cell_offsets[nl_idx + 1u];\n";
    ss << "            for (var nl_s = nl_start; nl_s < nl_end; nl_s++) {\n";
    if (maxNeighbors > 0) {
        ss << "                if (nl_count >= " << maxNeighbors << "u) {\n";
        ss << "                    break;\n";
        ss << "                }\n";
    }
    ss << "                let other_idx = sorted_indices[nl_s];\n";
    ss << "                if (other_idx == index) {\n";
    ss << "                    continue;\n";
    ss << "                }\n";
    ss << "                let other = particles_read[other_idx];\n";
    ss << "                if (other.alive == 0u) {\n";
    ss << "                    continue;\n";
    ss << "                }\n";
    ss << "                let nl_delta = nl_center - other.position;\n";
    ss << "                let neighbor_dist = length(nl_delta);\n";
    ss << "                if (neighbor_dist >= nl_radius) {\n";
    ss << "                    continue;\n";
    ss << "                }\n";
    ss << "                var neighbor_dir = vec3<f32>(0.0);\n";
    ss << "                if (neighbor_dist > 1e-6) {\n";
    ss << "                    neighbor_dir = nl_delta / neighbor_dist;\n";
    ss << "                }\n";
    ss << "                nl_count += 1u;\n";
    ss << body;
    ss << "            }\n";
    ss << "        }\n";
    ss << "        }\n";
    ss << "        }\n";
    ss << "    }\n";
    return ss.str();
}

namespace {

// Flattened 2D dispatch index for one-thread-per-item passes of 64 threads
const char* ITEM_INDEX = "gid.x + gid.y * nwg.x * 64u";

} // namespace

std::string gridCountProgram(const ParticleLayout& layout) {
    std::ostringstream ss;
    ss << layout.toWgsl();
    ss << gridHelpersWgsl();
    ss << R"(
@group(0) @binding(0) var<storage, read> particles_read: array<Particle>;
@group(0) @binding(1) var<uniform> grid: GridParams;
@group(0) @binding(2) var<storage, read_write> cell_counts: array<atomic<u32>>;

@compute @workgroup_size(64)
fn grid_count(@builtin(global_invocation_id) gid: vec3<u32>,
              @builtin(num_workgroups) nwg: vec3<u32>) {
    let i = )" << ITEM_INDEX << R"(;
    if (i >= grid.num_particles) {
        return;
    }
    let c = grid_cell_index(grid_cell_coord(particles_read[i].position));
    atomicAdd(&cell_counts[c], 1u);
}
)";
    return ss.str();
}

std::string gridScatterProgram(const ParticleLayout& layout) {
    std::ostringstream ss;
    ss << layout.toWgsl();
    ss << gridHelpersWgsl();
    ss << R"(
@group(0) @binding(0) var<storage, read> particles_read: array<Particle>;
@group(0) @binding(1) var<uniform> grid: GridParams;
@group(0) @binding(2) var<storage, read> cell_offsets: array<u32>;
@group(0) @binding(3) var<storage, read_write> cell_next: array<atomic<u32>>;
@group(0) @binding(4) var<storage, read_write> sorted_indices: array<u32>;

@compute @workgroup_size(64)
fn grid_scatter(@builtin(global_invocation_id) gid: vec3<u32>,
                @builtin(num_workgroups) nwg: vec3<u32>) {
    let i = )" << ITEM_INDEX << R"(;
    if (i >= grid.num_particles) {
        return;
    }
    let c = grid_cell_index(grid_cell_coord(particles_read[i].position));
    let slot = cell_offsets[c] + atomicAdd(&cell_next[c], 1u);
    sorted_indices[slot] = i;
}
)";
    return ss.str();
}

std::string gridScanProgram() {
    return R"(
struct ScanParams {
    count: u32,
    num_blocks: u32,
    _pad0: u32,
    _pad1: u32,
};

@group(0) @binding(0) var<uniform> scan: ScanParams;
@group(0) @binding(1) var<storage, read> scan_input: array<u32>;
@group(0) @binding(2) var<storage, read_write> scan_output: array<u32>;
@group(0) @binding(3) var<storage, read_write> block_sums: array<u32>;

var<workgroup> scan_temp: array<u32, 256>;

// Exclusive scan of one 256-element block; block totals go to block_sums
@compute @workgroup_size(256)
fn scan_blocks(@builtin(local_invocation_id) lid: vec3<u32>,
               @builtin(workgroup_id) wid: vec3<u32>,
               @builtin(num_workgroups) nwg: vec3<u32>) {
    let block = wid.x + wid.y * nwg.x;
    let i = block * 256u + lid.x;
    var v = 0u;
    if (i < scan.count) {
        v = scan_input[i];
    }
    scan_temp[lid.x] = v;
    workgroupBarrier();

    for (var offset = 1u; offset < 256u; offset = offset * 2u) {
        var add = 0u;
        if (lid.x >= offset) {
            add = scan_temp[lid.x - offset];
        }
        workgroupBarrier();
        scan_temp[lid.x] = scan_temp[lid.x] + add;
        workgroupBarrier();
    }

    if (i < scan.count) {
        scan_output[i] = scan_temp[lid.x] - v;
    }
    if (lid.x == 255u && block < scan.num_blocks) {
        block_sums[block] = scan_temp[255];
    }
}
)";
}

std::string gridAddOffsetsProgram() {
    return R"(
struct ScanParams {
    count: u32,
    num_blocks: u32,
    _pad0: u32,
    _pad1: u32,
};

@group(0) @binding(0) var<uniform> scan: ScanParams;
@group(0) @binding(1) var<storage, read> block_offsets: array<u32>;
@group(0) @binding(2) var<storage, read_write> scan_data: array<u32>;

@compute @workgroup_size(256)
fn add_block_offsets(@builtin(local_invocation_id) lid: vec3<u32>,
                     @builtin(workgroup_id) wid: vec3<u32>,
                     @builtin(num_workgroups) nwg: vec3<u32>) {
    let block = wid.x + wid.y * nwg.x;
    let i = block * 256u + lid.x;
    if (i < scan.count) {
        scan_data[i] = scan_data[i] + block_offsets[block];
    }
}
)";
}

} // namespace flux
