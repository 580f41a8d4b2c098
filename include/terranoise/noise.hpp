/**
 * @file noise.hpp
 * @brief Gradient noise primitive and per-octave gradient tables
 *
 * The base primitive is improved Perlin noise. Each octave of a fractal model
 * samples it in its own region of the lattice, displaced by that octave's
 * vector from a GradientTable. The table is the only seeded state; everything
 * downstream is a pure function of (point, table, parameters).
 */

#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace terranoise {

// ============================================================================
// Seed utilities
// ============================================================================

/// Deterministic seed derivation
class NoiseHash {
public:
    /// Derive an independent sub-seed from a base seed and salt
    [[nodiscard]] static uint64_t deriveSeed(uint64_t baseSeed, uint64_t salt);

    /// Map a 64-bit value to a double in [0, 1)
    [[nodiscard]] static double toUnitInterval(uint64_t bits);
};

// ============================================================================
// Base primitive
// ============================================================================

/// Noise value with its spatial derivative
struct NoiseSample {
    double value = 0.0;
    glm::dvec3 gradient{0.0};
};

/// Improved Perlin noise at p. Returns approximately [-1, 1].
[[nodiscard]] double gradientNoise(const glm::dvec3& p);

/// Improved Perlin noise at p with its analytic derivative
[[nodiscard]] NoiseSample gradientNoiseDeriv(const glm::dvec3& p);

// ============================================================================
// Gradient tables
// ============================================================================

/**
 * @brief Borrowed, read-only view of a gradient table
 *
 * Data is laid out as 3 x octaveCount doubles, components of one octave
 * contiguous. The view does not own the data; the owner must keep it alive
 * and unmodified while evaluations are in flight.
 */
class GradientTableView {
public:
    GradientTableView() = default;

    /// @throws std::invalid_argument if octaveCount < 0 or
    ///         data.size() != 3 * octaveCount
    GradientTableView(std::span<const double> data, int octaveCount);

    [[nodiscard]] int octaveCount() const { return octaveCount_; }
    [[nodiscard]] bool empty() const { return octaveCount_ == 0; }
    [[nodiscard]] std::span<const double> data() const { return data_; }

    /// Vector for one octave. Octave must be in [0, octaveCount).
    [[nodiscard]] glm::dvec3 gradient(int octave) const {
        const auto base = static_cast<size_t>(octave) * 3;
        return {data_[base], data_[base + 1], data_[base + 2]};
    }

private:
    std::span<const double> data_;
    int octaveCount_ = 0;
};

/// Owning gradient table of per-octave vectors
class GradientTable {
public:
    GradientTable() = default;

    /// Build from explicit vectors (need not be unit length)
    explicit GradientTable(const std::vector<glm::dvec3>& gradients);

    /**
     * @brief Generate octaveCount unit vectors from a seed
     *
     * Same (seed, octaveCount) always yields a bit-identical table.
     * @throws std::invalid_argument if octaveCount < 0
     */
    [[nodiscard]] static GradientTable generate(uint64_t seed, int octaveCount);

    [[nodiscard]] int octaveCount() const { return static_cast<int>(data_.size() / 3); }
    [[nodiscard]] glm::dvec3 gradient(int octave) const { return view().gradient(octave); }

    /// Borrowed view; valid while this table is alive and unmodified
    [[nodiscard]] GradientTableView view() const {
        return GradientTableView(data_, octaveCount());
    }

    [[nodiscard]] const std::vector<double>& data() const { return data_; }

private:
    std::vector<double> data_;
};

// ============================================================================
// Per-octave sampling
// ============================================================================

/// Scale applied to each octave's table vector before it offsets the sample
inline constexpr double kOctaveOffset = 64.0;

/// Octave `octave` of the primitive at p * frequency + gradient(octave) * kOctaveOffset
[[nodiscard]] double octaveNoise(const glm::dvec3& p, int octave,
                                 const GradientTableView& table, double frequency);

/// Same as octaveNoise, with the derivative w.r.t. the lattice coordinate
[[nodiscard]] NoiseSample octaveNoiseDeriv(const glm::dvec3& p, int octave,
                                           const GradientTableView& table, double frequency);

}  // namespace terranoise
