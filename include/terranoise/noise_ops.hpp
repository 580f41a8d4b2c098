/**
 * @file noise_ops.hpp
 * @brief Fractal combinators and model dispatch
 *
 * Every combinator runs exactly table.octaveCount() octaves, returns 0 for an
 * empty table and multiplies its accumulated value by params.noiseHeight.
 * All functions are pure; any number of threads may call them against the
 * same table.
 *
 *   auto table = GradientTable::generate(seed, 12);
 *   double h = evaluateNoise(NoiseModel::Ridged, point, table.view(),
 *                            defaultNoiseParams(NoiseModel::Ridged));
 */

#pragma once

#include "terranoise/noise.hpp"
#include "terranoise/noise_model.hpp"

#include <string_view>

namespace terranoise {

/// Frequency multiplier per octave for the persistence-driven models
inline constexpr double kOctaveFrequencyStep = 2.0;

/// Ridged: how strongly one octave's signal gates the next
inline constexpr double kRidgeWeightGain = 2.0;

// ============================================================================
// Fractal combinators
// ============================================================================

/// Sum of persistence^i * |n_i|. Same sign as noiseHeight for persistence >= 0.
[[nodiscard]] double turbulence(const glm::dvec3& p, const GradientTableView& table,
                                const NoiseParams& params);

/// Sum of persistence^i * (2|n_i| - 1)
[[nodiscard]] double billowed(const glm::dvec3& p, const GradientTableView& table,
                              const NoiseParams& params);

/**
 * @brief Power-law spectrum: octave amplitude is f_i^-slope
 *
 * An octave whose frequency is exactly zero gets amplitude 1. A negative
 * frequency with a fractional slope produces NaN.
 */
[[nodiscard]] double powerLaw(const glm::dvec3& p, const GradientTableView& table,
                              const NoiseParams& params);

/// Ridged multifractal. Non-negative for persistence >= 0 and noiseHeight >= 0.
[[nodiscard]] double ridged(const glm::dvec3& p, const GradientTableView& table,
                            const NoiseParams& params);

/**
 * @brief Swiss turbulence
 *
 * Each octave contributes the ridge 1 - |n|. Its input is displaced by
 * warp times the accumulated ridge derivative of the earlier octaves, and the
 * next amplitude is scaled by gain * (1 - ridge), so detail thins where an
 * octave was already strong.
 */
[[nodiscard]] double swiss(const glm::dvec3& p, const GradientTableView& table,
                           const NoiseParams& params);

/**
 * @brief Jordan turbulence
 *
 * Octave 0 (n^2) seeds the warp and damping accumulators through warp0 and
 * damp0. Later octaves start at amplitude gain0 and decay by gain. Each is
 * offset in lattice space by the warp accumulator and damped by
 * 1 / (1 + dampScale * |D|^2), where D is the damping accumulator.
 */
[[nodiscard]] double jordan(const glm::dvec3& p, const GradientTableView& table,
                            const NoiseParams& params);

// ============================================================================
// Dispatch
// ============================================================================

/// Evaluate one model. Octave count comes from the table.
[[nodiscard]] double evaluateNoise(NoiseModel model, const glm::dvec3& p,
                                   const GradientTableView& table, const NoiseParams& params);

/**
 * @brief Check a name-keyed request before evaluating it
 *
 * Callers that must tell "unknown model" apart from a genuine zero should
 * validate at setup time; the name-keyed evaluateNoise cannot signal it.
 */
[[nodiscard]] NoiseStatus validateNoiseRequest(std::string_view modelName, int numOctaves,
                                               const GradientTableView* table);

/**
 * @brief Name-keyed entry point for host bindings
 *
 * Returns 0.0 ("no noise applied") for an unknown model name, an absent
 * table, or a numOctaves that differs from the table's octave count. No
 * combinator runs in those cases.
 */
[[nodiscard]] double evaluateNoise(std::string_view modelName,
                                   double x, double y, double z,
                                   int numOctaves, const GradientTableView* table,
                                   const NoiseParams& params);

}  // namespace terranoise
