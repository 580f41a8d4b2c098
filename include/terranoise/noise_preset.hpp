/**
 * @file noise_preset.hpp
 * @brief Named noise configurations loaded from config files
 *
 * A preset is everything needed to perturb a surface: the model, how many
 * octaves and which seed build the gradient table, the horizontal scale
 * (noise_width) that normalizes node positions, and the model parameters.
 *
 *   model: jordan
 *   octaves: 12
 *   seed: 42
 *   noise_width: 500e3
 *   gain0: 60
 */

#pragma once

#include "terranoise/config_parser.hpp"
#include "terranoise/noise.hpp"
#include "terranoise/noise_model.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace terranoise {

struct NoisePreset {
    static constexpr int kDefaultOctaves = 12;
    /// Frequency doubles per octave, so past this the lattice loses double precision
    static constexpr int kMaxOctaves = 64;
    static constexpr uint64_t kDefaultSeed = 235029385;
    static constexpr double kDefaultNoiseWidth = 1000e3;

    NoiseModel model = NoiseModel::Turbulence;
    int octaves = kDefaultOctaves;
    uint64_t seed = kDefaultSeed;
    double noiseWidth = kDefaultNoiseWidth;  ///< Length over which the base frequency spans one lattice cell
    NoiseParams params;

    /// Preset for a model with its default parameters
    [[nodiscard]] static NoisePreset defaults(NoiseModel model);

    /// Gradient table for this preset's seed and octave count
    [[nodiscard]] GradientTable makeGradientTable() const {
        return GradientTable::generate(seed, octaves);
    }
};

/**
 * @brief Build a preset from a parsed config document
 *
 * `model` is required. Missing keys take the model's defaults. Returns
 * nullopt (and logs why) for an unknown model, a non-numeric value, an
 * octave count that is not a whole number in [0, kMaxOctaves], a seed that
 * is not an unsigned 64-bit integer, or a non-positive noise_width.
 */
[[nodiscard]] std::optional<NoisePreset> loadNoisePreset(const ConfigDocument& doc);

/// Parse and load a preset file
[[nodiscard]] std::optional<NoisePreset> loadNoisePresetFile(const std::string& path);

}  // namespace terranoise
