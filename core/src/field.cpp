// Flux - Spatial Field Implementation

#include <flux/field.h>
#include <flux/layout.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace flux {

namespace {

// Largest combined field buffer (128 MiB, the default storage binding limit)
constexpr uint64_t MAX_FIELD_ELEMENTS = (128ull << 20) / 4;

std::string upperName(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

int32_t toFixed(float v) {
    float scaled = std::clamp(v * FIELD_SCALE, -2.0e9f, 2.0e9f);
    return static_cast<int32_t>(std::round(scaled));
}

} // namespace

// =============================================================================
// FieldRegistry
// =============================================================================

std::optional<FieldRegistry> FieldRegistry::build(const std::vector<FieldConfig>& fields,
                                                  BuildError* error) {
    auto fail = [error](const std::string& msg) -> std::optional<FieldRegistry> {
        if (error) *error = makeError(ErrorKind::InvalidField, msg);
        return std::nullopt;
    };

    if (fields.size() > MAX_FIELDS) {
        return fail("at most " + std::to_string(MAX_FIELDS) + " fields are supported");
    }

    FieldRegistry reg;
    uint64_t base = 0;
    for (const FieldConfig& in : fields) {
        if (!isValidIdentifier(in.name)) {
            return fail("invalid field name '" + in.name + "'");
        }
        if (reg.find(in.name)) {
            return fail("duplicate field '" + in.name + "'");
        }
        if (in.resolution < MIN_FIELD_RESOLUTION || in.resolution > MAX_FIELD_RESOLUTION) {
            return fail("field '" + in.name + "' resolution must be in [" +
                        std::to_string(MIN_FIELD_RESOLUTION) + ", " +
                        std::to_string(MAX_FIELD_RESOLUTION) + "]");
        }
        if (!(in.extent > 0.0f)) {
            return fail("field '" + in.name + "' extent must be positive");
        }

        FieldConfig f = in;
        f.decay = std::clamp(f.decay, 0.0f, 1.0f);
        f.blur = std::clamp(f.blur, 0.0f, 1.0f);

        reg.m_bases.push_back(static_cast<uint32_t>(base));
        base += f.elementCount();
        if (base > MAX_FIELD_ELEMENTS) {
            return fail("fields exceed the maximum combined size");
        }
        reg.m_fields.push_back(f);
    }
    return reg;
}

std::optional<uint32_t> FieldRegistry::idOf(const std::string& name) const {
    for (uint32_t i = 0; i < m_fields.size(); ++i) {
        if (m_fields[i].name == name) return i;
    }
    return std::nullopt;
}

const FieldConfig* FieldRegistry::find(const std::string& name) const {
    auto id = idOf(name);
    return id ? &m_fields[*id] : nullptr;
}

uint32_t FieldRegistry::totalElements() const {
    uint32_t total = 0;
    for (const FieldConfig& f : m_fields) {
        total += f.elementCount();
    }
    return std::max(total, 4u);
}

std::vector<FieldParamsData> FieldRegistry::params() const {
    std::vector<FieldParamsData> out(MAX_FIELDS, FieldParamsData{});
    for (uint32_t i = 0; i < m_fields.size(); ++i) {
        const FieldConfig& f = m_fields[i];
        out[i].resolution = f.resolution;
        out[i].base = m_bases[i];
        out[i].components = f.components();
        out[i].extent = f.extent;
        out[i].decay = f.decay;
        out[i].blur = f.blur;
    }
    return out;
}

std::string FieldRegistry::declarationsWgsl(uint32_t group) const {
    std::ostringstream ss;
    ss << "\nstruct FieldParams {\n";
    ss << "    resolution: u32,\n";
    ss << "    base: u32,\n";
    ss << "    components: u32,\n";
    ss << "    extent: f32,\n";
    ss << "    decay: f32,\n";
    ss << "    blur: f32,\n";
    ss << "    _pad0: u32,\n";
    ss << "    _pad1: u32,\n";
    ss << "};\n\n";
    ss << "const FIELD_SCALE: f32 = " << wgslFloat(FIELD_SCALE) << ";\n";
    for (uint32_t i = 0; i < m_fields.size(); ++i) {
        ss << "const FIELD_" << upperName(m_fields[i].name) << ": u32 = " << i << "u;\n";
    }
    ss << "\n";
    ss << "@group(" << group << ") @binding(0) var<storage, read_write> field_deposit: array<atomic<i32>>;\n";
    ss << "@group(" << group << ") @binding(1) var<storage, read> field_data: array<f32>;\n";
    ss << "@group(" << group << ") @binding(2) var<uniform> field_params: array<FieldParams, "
       << MAX_FIELDS << ">;\n";
    ss << fieldHelpersWgsl();
    return ss.str();
}

std::string fieldHelpersWgsl() {
    return R"(
fn field_grid_pos(fp: FieldParams, pos: vec3<f32>) -> vec3<f32> {
    return (pos + vec3<f32>(fp.extent)) / (2.0 * fp.extent) * f32(fp.resolution) - 0.5;
}

fn field_element(fp: FieldParams, c: vec3<u32>) -> u32 {
    let r = fp.resolution;
    return fp.base + (c.x + c.y * r + c.z * r * r) * fp.components;
}

fn field_voxel_value(fp: FieldParams, c: vec3<u32>) -> vec4<f32> {
    let e = field_element(fp, c);
    if (fp.components == 1u) {
        return vec4<f32>(field_data[e], 0.0, 0.0, 0.0);
    }
    return vec4<f32>(field_data[e], field_data[e + 1u], field_data[e + 2u], field_data[e + 3u]);
}

// Trilinear sample, clamped to the outer voxel centers
fn field_sample(id: u32, pos: vec3<f32>) -> vec4<f32> {
    let fp = field_params[id];
    let last = f32(fp.resolution - 1u);
    let g = clamp(field_grid_pos(fp, pos), vec3<f32>(0.0), vec3<f32>(last));
    let g0 = floor(g);
    let t = g - g0;
    let c0 = vec3<u32>(g0);
    let c1 = min(c0 + vec3<u32>(1u), vec3<u32>(fp.resolution - 1u));
    var result = vec4<f32>(0.0);
    for (var k = 0u; k < 8u; k++) {
        let o = vec3<bool>((k & 1u) != 0u, (k & 2u) != 0u, (k & 4u) != 0u);
        let c = select(c0, c1, o);
        let w3 = select(vec3<f32>(1.0) - t, t, o);
        result += field_voxel_value(fp, c) * (w3.x * w3.y * w3.z);
    }
    return result;
}

// Distribute v over the 8 enclosing voxels; corners outside the grid are dropped
fn field_splat(id: u32, pos: vec3<f32>, v: vec4<f32>, first: u32, count: u32) {
    let fp = field_params[id];
    let g = field_grid_pos(fp, pos);
    let g0 = floor(g);
    let t = g - g0;
    let r = i32(fp.resolution);
    for (var k = 0u; k < 8u; k++) {
        let o = vec3<bool>((k & 1u) != 0u, (k & 2u) != 0u, (k & 4u) != 0u);
        let ci = vec3<i32>(g0) + select(vec3<i32>(0), vec3<i32>(1), o);
        if (any(ci < vec3<i32>(0)) || any(ci >= vec3<i32>(r))) {
            continue;
        }
        let w3 = select(vec3<f32>(1.0) - t, t, o);
        let w = w3.x * w3.y * w3.z;
        if (w <= 0.0) {
            continue;
        }
        let e = field_element(fp, vec3<u32>(ci));
        for (var j = 0u; j < count; j++) {
            let comp = first + j;
            let amount = clamp(v[comp] * w * FIELD_SCALE, -2.0e9, 2.0e9);
            atomicAdd(&field_deposit[e + comp], i32(round(amount)));
        }
    }
}

// Scalar value; magnitude of xyz for vector fields
fn field_read(id: u32, pos: vec3<f32>) -> f32 {
    let v = field_sample(id, pos);
    if (field_params[id].components == 1u) {
        return v.x;
    }
    return length(v.xyz);
}

fn field_read_vec(id: u32, pos: vec3<f32>) -> vec4<f32> {
    return field_sample(id, pos);
}

// Deposit a scalar; vector fields receive it in w
fn field_write(id: u32, pos: vec3<f32>, v: f32) {
    if (field_params[id].components == 1u) {
        field_splat(id, pos, vec4<f32>(v, 0.0, 0.0, 0.0), 0u, 1u);
    } else {
        field_splat(id, pos, vec4<f32>(0.0, 0.0, 0.0, v), 3u, 1u);
    }
}

// Deposit xyz; scalar fields receive x only
fn field_write_vec(id: u32, pos: vec3<f32>, v: vec3<f32>) {
    if (field_params[id].components == 1u) {
        field_splat(id, pos, vec4<f32>(v.x, 0.0, 0.0, 0.0), 0u, 1u);
    } else {
        field_splat(id, pos, vec4<f32>(v, 0.0), 0u, 3u);
    }
}

fn field_gradient(id: u32, pos: vec3<f32>) -> vec3<f32> {
    let fp = field_params[id];
    let h = 2.0 * fp.extent / f32(fp.resolution);
    let dx = vec3<f32>(h, 0.0, 0.0);
    let dy = vec3<f32>(0.0, h, 0.0);
    let dz = vec3<f32>(0.0, 0.0, h);
    return vec3<f32>(
        field_read(id, pos + dx) - field_read(id, pos - dx),
        field_read(id, pos + dy) - field_read(id, pos - dy),
        field_read(id, pos + dz) - field_read(id, pos - dz)) / (2.0 * h);
}
)";
}

std::string fieldEngineProgram() {
    std::ostringstream ss;
    ss << "const FIELD_SCALE: f32 = " << wgslFloat(FIELD_SCALE) << ";\n";
    ss << R"(
struct FieldPass {
    resolution: u32,
    base: u32,
    components: u32,
    axis: u32,
    decay: f32,
    blur: f32,
    count: u32,
    _pad: u32,
};

@group(0) @binding(0) var<uniform> pass_params: FieldPass;
@group(0) @binding(1) var<storage, read_write> field_deposit: array<atomic<i32>>;
@group(0) @binding(2) var<storage, read_write> field_a: array<f32>;
@group(0) @binding(3) var<storage, read_write> field_b: array<f32>;

fn item_index(gid: vec3<u32>, nwg: vec3<u32>) -> u32 {
    return gid.x + gid.y * nwg.x * 64u;
}

// Element index of the blur neighbor at step -1 or +1 along the pass axis
fn blur_neighbor(i: u32, step: i32) -> u32 {
    let r = pass_params.resolution;
    let comps = pass_params.components;
    let voxel = i / comps;
    let comp = i % comps;
    var c = vec3<i32>(i32(voxel % r), i32((voxel / r) % r), i32(voxel / (r * r)));
    let a = pass_params.axis;
    c[a] = clamp(c[a] + step, 0, i32(r) - 1);
    let n = u32(c.x) + u32(c.y) * r + u32(c.z) * r * r;
    return n * comps + comp;
}

@compute @workgroup_size(64)
fn merge_decay(@builtin(global_invocation_id) gid: vec3<u32>,
               @builtin(num_workgroups) nwg: vec3<u32>) {
    let i = item_index(gid, nwg);
    if (i >= pass_params.count) {
        return;
    }
    let e = pass_params.base + i;
    let deposited = f32(atomicExchange(&field_deposit[e], 0)) / FIELD_SCALE;
    field_a[e] = (field_a[e] + deposited) * pass_params.decay;
}

@compute @workgroup_size(64)
fn blur_ab(@builtin(global_invocation_id) gid: vec3<u32>,
           @builtin(num_workgroups) nwg: vec3<u32>) {
    let i = item_index(gid, nwg);
    if (i >= pass_params.count) {
        return;
    }
    let base = pass_params.base;
    let b = pass_params.blur;
    let l = field_a[base + blur_neighbor(i, -1)];
    let r = field_a[base + blur_neighbor(i, 1)];
    field_b[base + i] = field_a[base + i] * (1.0 - b) + (l + r) * b * 0.5;
}

@compute @workgroup_size(64)
fn blur_ba(@builtin(global_invocation_id) gid: vec3<u32>,
           @builtin(num_workgroups) nwg: vec3<u32>) {
    let i = item_index(gid, nwg);
    if (i >= pass_params.count) {
        return;
    }
    let base = pass_params.base;
    let b = pass_params.blur;
    let l = field_b[base + blur_neighbor(i, -1)];
    let r = field_b[base + blur_neighbor(i, 1)];
    field_a[base + i] = field_b[base + i] * (1.0 - b) + (l + r) * b * 0.5;
}
)";
    return ss.str();
}

uint32_t blurPassCount(const FieldConfig& config) {
    if (config.blur <= 0.0f) return 0;
    return config.blurIterations * 3;
}

// =============================================================================
// FieldVolume
// =============================================================================

FieldVolume::FieldVolume(const FieldConfig& config)
    : m_config(config)
    , m_data(config.elementCount(), 0.0f)
    , m_deposit(config.elementCount(), 0) {
    m_config.decay = std::clamp(m_config.decay, 0.0f, 1.0f);
    m_config.blur = std::clamp(m_config.blur, 0.0f, 1.0f);
}

glm::vec3 FieldVolume::gridPosition(const glm::vec3& pos) const {
    return (pos + glm::vec3(m_config.extent)) / (2.0f * m_config.extent) *
           static_cast<float>(m_config.resolution) - 0.5f;
}

uint32_t FieldVolume::element(uint32_t x, uint32_t y, uint32_t z, uint32_t component) const {
    uint32_t r = m_config.resolution;
    return (x + y * r + z * r * r) * m_config.components() + component;
}

float FieldVolume::voxel(uint32_t x, uint32_t y, uint32_t z, uint32_t component) const {
    return m_data[element(x, y, z, component)];
}

void FieldVolume::deposit(const glm::vec3& pos, const glm::vec4& value) {
    glm::vec3 g = gridPosition(pos);
    glm::vec3 g0 = glm::floor(g);
    glm::vec3 t = g - g0;
    int r = static_cast<int>(m_config.resolution);
    uint32_t comps = m_config.components();

    for (uint32_t k = 0; k < 8; ++k) {
        glm::ivec3 o((k & 1u) ? 1 : 0, (k & 2u) ? 1 : 0, (k & 4u) ? 1 : 0);
        glm::ivec3 c = glm::ivec3(g0) + o;
        if (c.x < 0 || c.y < 0 || c.z < 0 || c.x >= r || c.y >= r || c.z >= r) {
            continue;
        }
        float w = (o.x ? t.x : 1.0f - t.x) * (o.y ? t.y : 1.0f - t.y) * (o.z ? t.z : 1.0f - t.z);
        if (w <= 0.0f) continue;
        for (uint32_t j = 0; j < comps; ++j) {
            m_deposit[element(c.x, c.y, c.z, j)] += toFixed(value[j] * w);
        }
    }
}

glm::vec4 FieldVolume::sample(const glm::vec3& pos) const {
    float last = static_cast<float>(m_config.resolution - 1);
    glm::vec3 g = glm::clamp(gridPosition(pos), glm::vec3(0.0f), glm::vec3(last));
    glm::vec3 g0 = glm::floor(g);
    glm::vec3 t = g - g0;
    glm::uvec3 c0(g0);
    glm::uvec3 c1 = glm::min(c0 + glm::uvec3(1u), glm::uvec3(m_config.resolution - 1));
    uint32_t comps = m_config.components();

    glm::vec4 result(0.0f);
    for (uint32_t k = 0; k < 8; ++k) {
        bool ox = k & 1u, oy = k & 2u, oz = k & 4u;
        glm::uvec3 c(ox ? c1.x : c0.x, oy ? c1.y : c0.y, oz ? c1.z : c0.z);
        float w = (ox ? t.x : 1.0f - t.x) * (oy ? t.y : 1.0f - t.y) * (oz ? t.z : 1.0f - t.z);
        for (uint32_t j = 0; j < comps; ++j) {
            result[j] += m_data[element(c.x, c.y, c.z, j)] * w;
        }
    }
    return result;
}

void FieldVolume::blurAxis(const std::vector<float>& src, std::vector<float>& dst, uint32_t axis) const {
    uint32_t r = m_config.resolution;
    uint32_t comps = m_config.components();
    float b = m_config.blur;
    for (uint32_t z = 0; z < r; ++z) {
        for (uint32_t y = 0; y < r; ++y) {
            for (uint32_t x = 0; x < r; ++x) {
                glm::uvec3 c(x, y, z);
                glm::uvec3 lo = c;
                glm::uvec3 hi = c;
                lo[axis] = c[axis] > 0 ? c[axis] - 1 : 0;
                hi[axis] = std::min(c[axis] + 1, r - 1);
                for (uint32_t j = 0; j < comps; ++j) {
                    float l = src[element(lo.x, lo.y, lo.z, j)];
                    float h = src[element(hi.x, hi.y, hi.z, j)];
                    uint32_t e = element(x, y, z, j);
                    dst[e] = src[e] * (1.0f - b) + (l + h) * b * 0.5f;
                }
            }
        }
    }
}

void FieldVolume::step() {
    for (size_t i = 0; i < m_data.size(); ++i) {
        float deposited = static_cast<float>(static_cast<int32_t>(m_deposit[i])) / FIELD_SCALE;
        m_data[i] = (m_data[i] + deposited) * m_config.decay;
        m_deposit[i] = 0;
    }

    uint32_t passes = blurPassCount(m_config);
    std::vector<float> scratch(m_data.size(), 0.0f);
    for (uint32_t pass = 0; pass < passes; ++pass) {
        blurAxis(m_data, scratch, pass % 3);
        m_data.swap(scratch);
    }
}

} // namespace flux
