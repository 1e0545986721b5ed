#pragma once

/**
 * @file shader_lib.h
 * @brief WGSL helper library shared by every generated program
 *
 * The snippets are plain WGSL and are concatenated by the shader builder.
 * User rule snippets may call anything declared here.
 *
 * - RANDOM: hash, hash2, rand, rand_range, rand_vec3, rand_sphere,
 *   rand_in_sphere, rand_cone
 * - NOISE: noise2, noise3, fbm2, fbm3, curl_noise
 * - COLOR: hsv_to_rgb, rgb_to_hsv
 *
 * hashU32() and randFloat() reproduce `hash` and `rand` bit for bit on the
 * host so tests can predict GPU draws.
 */

#include <cstdint>

namespace flux::wgsl {

inline constexpr const char* CONSTANTS = R"(
const PI: f32 = 3.14159265359;
const TAU: f32 = 6.28318530718;
const NO_PARTICLE: u32 = 0xffffffffu;
)";

inline constexpr const char* RANDOM = R"(
// PCG hash
fn hash(v: u32) -> u32 {
    let state = v * 747796405u + 2891336453u;
    let word = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;
    return (word >> 22u) ^ word;
}

fn hash2(a: u32, b: u32) -> u32 {
    return hash(a ^ (hash(b) + 0x9e3779b9u + (a << 6u) + (a >> 2u)));
}

// Uniform in [0, 1)
fn rand(seed: u32) -> f32 {
    return f32(hash(seed) >> 8u) / 16777216.0;
}

fn rand_range(seed: u32, lo: f32, hi: f32) -> f32 {
    return lo + (hi - lo) * rand(seed);
}

// Each component uniform in [-1, 1)
fn rand_vec3(seed: u32) -> vec3<f32> {
    return vec3<f32>(rand(seed), rand(hash(seed)), rand(hash(hash(seed)))) * 2.0 - 1.0;
}

// Uniform direction on the unit sphere
fn rand_sphere(seed: u32) -> vec3<f32> {
    let z = rand(seed) * 2.0 - 1.0;
    let phi = rand(hash(seed)) * TAU;
    let r = sqrt(max(0.0, 1.0 - z * z));
    return vec3<f32>(r * cos(phi), r * sin(phi), z);
}

// Uniform point inside the unit ball
fn rand_in_sphere(seed: u32) -> vec3<f32> {
    return rand_sphere(seed) * pow(rand(hash2(seed, 7u)), 1.0 / 3.0);
}

// Uniform direction within `spread` radians of `axis`
fn rand_cone(seed: u32, axis: vec3<f32>, spread: f32) -> vec3<f32> {
    let cos_max = cos(clamp(spread, 0.0, PI));
    let z = mix(cos_max, 1.0, rand(seed));
    let phi = rand(hash(seed)) * TAU;
    let r = sqrt(max(0.0, 1.0 - z * z));
    var n = vec3<f32>(0.0, 1.0, 0.0);
    if (length(axis) > 1e-6) {
        n = normalize(axis);
    }
    var helper = vec3<f32>(1.0, 0.0, 0.0);
    if (abs(n.x) > 0.9) {
        helper = vec3<f32>(0.0, 1.0, 0.0);
    }
    let t = normalize(cross(helper, n));
    let b = cross(n, t);
    return t * (r * cos(phi)) + b * (r * sin(phi)) + n * z;
}
)";

inline constexpr const char* NOISE = R"(
fn mod289_2(x: vec2<f32>) -> vec2<f32> {
    return x - floor(x * (1.0 / 289.0)) * 289.0;
}

fn mod289_3(x: vec3<f32>) -> vec3<f32> {
    return x - floor(x * (1.0 / 289.0)) * 289.0;
}

fn mod289_4(x: vec4<f32>) -> vec4<f32> {
    return x - floor(x * (1.0 / 289.0)) * 289.0;
}

fn permute3(x: vec3<f32>) -> vec3<f32> {
    return mod289_3(((x * 34.0) + 10.0) * x);
}

fn permute4(x: vec4<f32>) -> vec4<f32> {
    return mod289_4(((x * 34.0) + 10.0) * x);
}

// 2D simplex noise, roughly in [-1, 1]
fn noise2(v: vec2<f32>) -> f32 {
    let C = vec4<f32>(0.211324865405187, 0.366025403784439, -0.577350269189626, 0.024390243902439);
    var i = floor(v + dot(v, C.yy));
    let x0 = v - i + dot(i, C.xx);
    var i1 = vec2<f32>(0.0, 1.0);
    if (x0.x > x0.y) {
        i1 = vec2<f32>(1.0, 0.0);
    }
    var x12 = x0.xyxy + C.xxzz;
    x12 = vec4<f32>(x12.xy - i1, x12.zw);
    i = mod289_2(i);
    let p = permute3(permute3(i.y + vec3<f32>(0.0, i1.y, 1.0)) + i.x + vec3<f32>(0.0, i1.x, 1.0));
    var m = max(0.5 - vec3<f32>(dot(x0, x0), dot(x12.xy, x12.xy), dot(x12.zw, x12.zw)), vec3<f32>(0.0));
    m = m * m;
    m = m * m;
    let x = 2.0 * fract(p * C.www) - 1.0;
    let h = abs(x) - 0.5;
    let ox = floor(x + 0.5);
    let a0 = x - ox;
    m = m * (1.79284291400159 - 0.85373472095314 * (a0 * a0 + h * h));
    let g = vec3<f32>(a0.x * x0.x + h.x * x0.y, a0.yz * x12.xz + h.yz * x12.yw);
    return 130.0 * dot(m, g);
}

// 3D simplex noise, roughly in [-1, 1]
fn noise3(v: vec3<f32>) -> f32 {
    let C = vec2<f32>(1.0 / 6.0, 1.0 / 3.0);
    let D = vec4<f32>(0.0, 0.5, 1.0, 2.0);
    var i = floor(v + dot(v, C.yyy));
    let x0 = v - i + dot(i, C.xxx);
    let g = step(x0.yzx, x0.xyz);
    let l = 1.0 - g;
    let i1 = min(g.xyz, l.zxy);
    let i2 = max(g.xyz, l.zxy);
    let x1 = x0 - i1 + C.xxx;
    let x2 = x0 - i2 + C.yyy;
    let x3 = x0 - D.yyy;
    i = mod289_3(i);
    let p = permute4(permute4(permute4(
        i.z + vec4<f32>(0.0, i1.z, i2.z, 1.0))
        + i.y + vec4<f32>(0.0, i1.y, i2.y, 1.0))
        + i.x + vec4<f32>(0.0, i1.x, i2.x, 1.0));
    let n_ = 0.142857142857;
    let ns = n_ * D.wyz - D.xzx;
    let j = p - 49.0 * floor(p * ns.z * ns.z);
    let x_ = floor(j * ns.z);
    let y_ = floor(j - 7.0 * x_);
    let x = x_ * ns.x + ns.yyyy;
    let y = y_ * ns.x + ns.yyyy;
    let h = 1.0 - abs(x) - abs(y);
    let b0 = vec4<f32>(x.xy, y.xy);
    let b1 = vec4<f32>(x.zw, y.zw);
    let s0 = floor(b0) * 2.0 + 1.0;
    let s1 = floor(b1) * 2.0 + 1.0;
    let sh = -step(h, vec4<f32>(0.0));
    let a0 = b0.xzyw + s0.xzyw * sh.xxyy;
    let a1 = b1.xzyw + s1.xzyw * sh.zzww;
    var p0 = vec3<f32>(a0.xy, h.x);
    var p1 = vec3<f32>(a0.zw, h.y);
    var p2 = vec3<f32>(a1.xy, h.z);
    var p3 = vec3<f32>(a1.zw, h.w);
    let norm = 1.79284291400159 - 0.85373472095314 *
        vec4<f32>(dot(p0, p0), dot(p1, p1), dot(p2, p2), dot(p3, p3));
    p0 = p0 * norm.x;
    p1 = p1 * norm.y;
    p2 = p2 * norm.z;
    p3 = p3 * norm.w;
    var m = max(0.6 - vec4<f32>(dot(x0, x0), dot(x1, x1), dot(x2, x2), dot(x3, x3)), vec4<f32>(0.0));
    m = m * m;
    return 42.0 * dot(m * m, vec4<f32>(dot(p0, x0), dot(p1, x1), dot(p2, x2), dot(p3, x3)));
}

fn fbm2(p: vec2<f32>, octaves: i32) -> f32 {
    var value = 0.0;
    var amplitude = 0.5;
    var pos = p;
    for (var i = 0; i < octaves; i++) {
        value += amplitude * noise2(pos);
        pos = pos * 2.0;
        amplitude *= 0.5;
    }
    return value;
}

fn fbm3(p: vec3<f32>, octaves: i32) -> f32 {
    var value = 0.0;
    var amplitude = 0.5;
    var pos = p;
    for (var i = 0; i < octaves; i++) {
        value += amplitude * noise3(pos);
        pos = pos * 2.0;
        amplitude *= 0.5;
    }
    return value;
}

// Divergence-free flow from the curl of a noise potential
fn curl_noise(p: vec3<f32>) -> vec3<f32> {
    let e = 0.01;
    let dx = vec3<f32>(e, 0.0, 0.0);
    let dy = vec3<f32>(0.0, e, 0.0);
    let dz = vec3<f32>(0.0, 0.0, e);
    let o1 = vec3<f32>(31.416, 47.853, 12.793);
    let o2 = vec3<f32>(-19.12, 73.31, -5.79);
    let dzdy = noise3(p + dy + o2) - noise3(p - dy + o2);
    let dydz = noise3(p + dz + o1) - noise3(p - dz + o1);
    let dxdz = noise3(p + dz) - noise3(p - dz);
    let dzdx = noise3(p + dx + o2) - noise3(p - dx + o2);
    let dydx = noise3(p + dx + o1) - noise3(p - dx + o1);
    let dxdy = noise3(p + dy) - noise3(p - dy);
    return vec3<f32>(dzdy - dydz, dxdz - dzdx, dydx - dxdy) / (2.0 * e);
}
)";

inline constexpr const char* COLOR = R"(
fn hsv_to_rgb(h: f32, s: f32, v: f32) -> vec3<f32> {
    let K = vec4<f32>(1.0, 2.0 / 3.0, 1.0 / 3.0, 3.0);
    let p = abs(fract(vec3<f32>(h) + K.xyz) * 6.0 - K.www);
    return v * mix(K.xxx, clamp(p - K.xxx, vec3<f32>(0.0), vec3<f32>(1.0)), s);
}

fn rgb_to_hsv(c: vec3<f32>) -> vec3<f32> {
    let K = vec4<f32>(0.0, -1.0 / 3.0, 2.0 / 3.0, -1.0);
    let p = mix(vec4<f32>(c.bg, K.wz), vec4<f32>(c.gb, K.xy), step(c.b, c.g));
    let q = mix(vec4<f32>(p.xyw, c.r), vec4<f32>(c.r, p.yzx), step(p.x, c.r));
    let d = q.x - min(q.w, q.y);
    let e = 1.0e-10;
    return vec3<f32>(abs(q.z + (q.w - q.y) / (6.0 * d + e)), d / (q.x + e), q.x);
}
)";

// -----------------------------------------------------------------------------
// Host mirrors
// -----------------------------------------------------------------------------

inline uint32_t hashU32(uint32_t v) {
    uint32_t state = v * 747796405u + 2891336453u;
    uint32_t word = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;
    return (word >> 22u) ^ word;
}

inline uint32_t hash2U32(uint32_t a, uint32_t b) {
    return hashU32(a ^ (hashU32(b) + 0x9e3779b9u + (a << 6u) + (a >> 2u)));
}

inline float randFloat(uint32_t seed) {
    return static_cast<float>(hashU32(seed) >> 8u) / 16777216.0f;
}

} // namespace flux::wgsl
