/**
 * @file noise_perlin.cpp
 * @brief Improved Perlin noise in double precision, with analytic derivatives
 *
 * Based on Ken Perlin's improved noise (2002) with the reference permutation,
 * so the primitive carries no seed of its own.
 */

#include "terranoise/noise.hpp"

#include <array>
#include <cmath>

namespace terranoise {

// ============================================================================
// NoiseHash
// ============================================================================

uint64_t NoiseHash::deriveSeed(uint64_t baseSeed, uint64_t salt) {
    uint64_t h = baseSeed;
    h ^= salt * 0x9e3779b97f4a7c15ULL;
    h *= 0xbf58476d1ce4e5b9ULL;
    h ^= h >> 31;
    h *= 0x94d049bb133111ebULL;
    h ^= h >> 31;
    return h;
}

double NoiseHash::toUnitInterval(uint64_t bits) {
    // Top 53 bits fill the mantissa exactly
    return static_cast<double>(bits >> 11) * 0x1.0p-53;
}

// ============================================================================
// Perlin helper functions
// ============================================================================

namespace {

constexpr std::array<uint8_t, 256> kReferencePermutation = {
    151, 160, 137, 91,  90,  15,  131, 13,  201, 95,  96,  53,  194, 233, 7,   225,
    140, 36,  103, 30,  69,  142, 8,   99,  37,  240, 21,  10,  23,  190, 6,   148,
    247, 120, 234, 75,  0,   26,  197, 62,  94,  252, 219, 203, 117, 35,  11,  32,
    57,  177, 33,  88,  237, 149, 56,  87,  174, 20,  125, 136, 171, 168, 68,  175,
    74,  165, 71,  134, 139, 48,  27,  166, 77,  146, 158, 231, 83,  111, 229, 122,
    60,  211, 133, 230, 220, 105, 92,  41,  55,  46,  245, 40,  244, 102, 143, 54,
    65,  25,  63,  161, 1,   216, 80,  73,  209, 76,  132, 187, 208, 89,  18,  169,
    200, 196, 135, 130, 116, 188, 159, 86,  164, 100, 109, 198, 173, 186, 3,   64,
    52,  217, 226, 250, 124, 123, 5,   202, 38,  147, 118, 126, 255, 82,  85,  212,
    207, 206, 59,  227, 47,  16,  58,  17,  182, 189, 28,  42,  223, 183, 170, 213,
    119, 248, 152, 2,   44,  154, 163, 70,  221, 153, 101, 155, 167, 43,  172, 9,
    129, 22,  39,  253, 19,  98,  108, 110, 79,  113, 224, 232, 178, 185, 112, 104,
    218, 246, 97,  228, 251, 34,  242, 193, 238, 210, 144, 12,  191, 179, 162, 241,
    81,  51,  145, 235, 249, 14,  239, 107, 49,  192, 214, 31,  181, 199, 106, 157,
    184, 84,  204, 176, 115, 121, 50,  45,  127, 4,   150, 254, 138, 236, 205, 93,
    222, 114, 67,  29,  24,  72,  243, 141, 128, 195, 78,  66,  215, 61,  156, 180,
};

/// Reference permutation duplicated to avoid overflow
constexpr std::array<uint8_t, 512> makePermutation() {
    std::array<uint8_t, 512> perm{};
    for (size_t i = 0; i < 512; ++i) {
        perm[i] = kReferencePermutation[i & 255];
    }
    return perm;
}

constexpr std::array<uint8_t, 512> kPerm = makePermutation();

/// The 12 cube-edge directions, padded to 16 so `hash & 15` selects one
constexpr double kGradients[16][3] = {
    { 1,  1,  0}, {-1,  1,  0}, { 1, -1,  0}, {-1, -1,  0},
    { 1,  0,  1}, {-1,  0,  1}, { 1,  0, -1}, {-1,  0, -1},
    { 0,  1,  1}, { 0, -1,  1}, { 0,  1, -1}, { 0, -1, -1},
    { 1,  1,  0}, { 1, -1,  0}, {-1,  1,  0}, {-1, -1,  0},
};

/// Improved Perlin fade curve: 6t^5 - 15t^4 + 10t^3
inline double fade(double t) {
    return t * t * t * (t * (t * 6.0 - 15.0) + 10.0);
}

/// Derivative of fade: 30t^4 - 60t^3 + 30t^2
inline double fadeDeriv(double t) {
    return 30.0 * t * t * (t * (t - 2.0) + 1.0);
}

inline double lerp(double t, double a, double b) {
    return a + t * (b - a);
}

inline double grad(int hash, double x, double y, double z) {
    const double* g = kGradients[hash & 15];
    return g[0] * x + g[1] * y + g[2] * z;
}

inline glm::dvec3 gradVector(int hash) {
    const double* g = kGradients[hash & 15];
    return {g[0], g[1], g[2]};
}

inline int perm(int i) {
    return kPerm[static_cast<size_t>(i)];
}

/// Lattice cell and corner hashes shared by both evaluation paths
struct Cell {
    double xf, yf, zf;
    int aa, ab, ba, bb;
};

Cell locate(const glm::dvec3& p) {
    const double fx = std::floor(p.x);
    const double fy = std::floor(p.y);
    const double fz = std::floor(p.z);

    // Wrap to 0..255
    const int xi = static_cast<int>(static_cast<int64_t>(fx) & 255);
    const int yi = static_cast<int>(static_cast<int64_t>(fy) & 255);
    const int zi = static_cast<int>(static_cast<int64_t>(fz) & 255);

    const int a = perm(xi) + yi;
    const int b = perm(xi + 1) + yi;

    return Cell{p.x - fx, p.y - fy, p.z - fz,
                perm(a) + zi, perm(a + 1) + zi, perm(b) + zi, perm(b + 1) + zi};
}

}  // namespace

// ============================================================================
// Primitive
// ============================================================================

double gradientNoise(const glm::dvec3& p) {
    const Cell c = locate(p);

    const double u = fade(c.xf);
    const double v = fade(c.yf);
    const double w = fade(c.zf);

    // Gradient dot products and trilinear interpolation
    const double x1 = lerp(u,
        grad(perm(c.aa), c.xf, c.yf, c.zf),
        grad(perm(c.ba), c.xf - 1.0, c.yf, c.zf));
    const double x2 = lerp(u,
        grad(perm(c.ab), c.xf, c.yf - 1.0, c.zf),
        grad(perm(c.bb), c.xf - 1.0, c.yf - 1.0, c.zf));
    const double y1 = lerp(v, x1, x2);

    const double x3 = lerp(u,
        grad(perm(c.aa + 1), c.xf, c.yf, c.zf - 1.0),
        grad(perm(c.ba + 1), c.xf - 1.0, c.yf, c.zf - 1.0));
    const double x4 = lerp(u,
        grad(perm(c.ab + 1), c.xf, c.yf - 1.0, c.zf - 1.0),
        grad(perm(c.bb + 1), c.xf - 1.0, c.yf - 1.0, c.zf - 1.0));
    const double y2 = lerp(v, x3, x4);

    return lerp(w, y1, y2);
}

NoiseSample gradientNoiseDeriv(const glm::dvec3& p) {
    const Cell c = locate(p);
    const double xf = c.xf, yf = c.yf, zf = c.zf;

    const double u = fade(xf);
    const double v = fade(yf);
    const double w = fade(zf);
    const double du = fadeDeriv(xf);
    const double dv = fadeDeriv(yf);
    const double dw = fadeDeriv(zf);

    // Corner hashes, named by (x, y, z) offset
    const int h000 = perm(c.aa);
    const int h100 = perm(c.ba);
    const int h010 = perm(c.ab);
    const int h110 = perm(c.bb);
    const int h001 = perm(c.aa + 1);
    const int h101 = perm(c.ba + 1);
    const int h011 = perm(c.ab + 1);
    const int h111 = perm(c.bb + 1);

    const double n000 = grad(h000, xf, yf, zf);
    const double n100 = grad(h100, xf - 1.0, yf, zf);
    const double n010 = grad(h010, xf, yf - 1.0, zf);
    const double n110 = grad(h110, xf - 1.0, yf - 1.0, zf);
    const double n001 = grad(h001, xf, yf, zf - 1.0);
    const double n101 = grad(h101, xf - 1.0, yf, zf - 1.0);
    const double n011 = grad(h011, xf, yf - 1.0, zf - 1.0);
    const double n111 = grad(h111, xf - 1.0, yf - 1.0, zf - 1.0);

    // Polynomial form of the trilinear blend
    const double k0 = n000;
    const double k1 = n100 - n000;
    const double k2 = n010 - n000;
    const double k3 = n001 - n000;
    const double k4 = n000 - n100 - n010 + n110;
    const double k5 = n000 - n010 - n001 + n011;
    const double k6 = n000 - n100 - n001 + n101;
    const double k7 = n100 + n010 + n001 + n111 - n000 - n110 - n011 - n101;

    NoiseSample s;
    s.value = k0 + k1 * u + k2 * v + k3 * w
            + k4 * u * v + k5 * v * w + k6 * u * w + k7 * u * v * w;

    // Corner gradients weighted by the same blend, plus the fade-curve terms
    const double iu = 1.0 - u, iv = 1.0 - v, iw = 1.0 - w;
    s.gradient = gradVector(h000) * (iu * iv * iw) + gradVector(h100) * (u * iv * iw)
               + gradVector(h010) * (iu * v * iw)  + gradVector(h110) * (u * v * iw)
               + gradVector(h001) * (iu * iv * w)  + gradVector(h101) * (u * iv * w)
               + gradVector(h011) * (iu * v * w)   + gradVector(h111) * (u * v * w);

    s.gradient.x += du * (k1 + k4 * v + k6 * w + k7 * v * w);
    s.gradient.y += dv * (k2 + k4 * u + k5 * w + k7 * u * w);
    s.gradient.z += dw * (k3 + k5 * v + k6 * u + k7 * u * v);

    return s;
}

// ============================================================================
// Per-octave sampling
// ============================================================================

double octaveNoise(const glm::dvec3& p, int octave,
                   const GradientTableView& table, double frequency) {
    return gradientNoise(p * frequency + table.gradient(octave) * kOctaveOffset);
}

NoiseSample octaveNoiseDeriv(const glm::dvec3& p, int octave,
                             const GradientTableView& table, double frequency) {
    return gradientNoiseDeriv(p * frequency + table.gradient(octave) * kOctaveOffset);
}

}  // namespace terranoise
