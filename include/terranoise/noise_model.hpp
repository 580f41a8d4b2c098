/**
 * @file noise_model.hpp
 * @brief Fractal model identifiers and their parameter bundle
 */

#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace terranoise {

/// The fractal combination models
enum class NoiseModel {
    Turbulence,  ///< Sum of absolute octaves
    Billowed,    ///< Sum of remapped absolute octaves, signed
    PowerLaw,    ///< Amplitude follows frequency^-slope
    Ridged,      ///< Ridged multifractal, non-negative
    Swiss,       ///< Derivative-warped ridges with amplitude thinning
    Jordan,      ///< Two-band warped and damped turbulence
};

inline constexpr std::array<NoiseModel, 6> kAllNoiseModels = {
    NoiseModel::Turbulence, NoiseModel::Billowed, NoiseModel::PowerLaw,
    NoiseModel::Ridged,     NoiseModel::Swiss,    NoiseModel::Jordan,
};

/// Name used in presets and at the name-keyed entry point ("plaw" for PowerLaw)
[[nodiscard]] std::string_view noiseModelName(NoiseModel model);

/// Parse a model name. Returns nullopt for anything unrecognized.
[[nodiscard]] std::optional<NoiseModel> parseNoiseModel(std::string_view name);

/**
 * @brief Parameters for every model
 *
 * Each model reads only its own subset:
 * - turbulence, billowed, ridged: frequency, persistence, noiseHeight
 * - plaw: frequency, slope, noiseHeight
 * - swiss: frequency, lacunarity, gain, warp, noiseHeight
 * - jordan: frequency, lacunarity, gain0, gain, warp0, warp, damp0, damp,
 *   dampScale, noiseHeight
 */
struct NoiseParams {
    double frequency = 1.0;
    double persistence = 0.5;
    double lacunarity = 2.0;
    double slope = 2.0;
    double noiseHeight = 1.0;
    double gain = 0.5;
    double gain0 = 1.0;
    double warp = 0.0;
    double warp0 = 0.0;
    double damp = 0.0;
    double damp0 = 0.0;
    double dampScale = 0.0;
};

/// Default parameters for a model, as used when applying noise to a surface
[[nodiscard]] NoiseParams defaultNoiseParams(NoiseModel model);

/// Outcome of validating a name-keyed evaluation request
enum class NoiseStatus {
    Ok,
    UnknownModel,
    MissingGradientTable,
    OctaveCountMismatch,
};

[[nodiscard]] std::string_view noiseStatusMessage(NoiseStatus status);

}  // namespace terranoise
