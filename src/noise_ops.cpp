/**
 * @file noise_ops.cpp
 * @brief Fractal combinators and model dispatch
 */

#include "terranoise/noise_ops.hpp"

#include <algorithm>
#include <cmath>

namespace terranoise {

// ============================================================================
// Persistence-driven models
// ============================================================================

double turbulence(const glm::dvec3& p, const GradientTableView& table,
                  const NoiseParams& params) {
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = params.frequency;

    for (int i = 0; i < table.octaveCount(); ++i) {
        value += amplitude * std::abs(octaveNoise(p, i, table, frequency));
        amplitude *= params.persistence;
        frequency *= kOctaveFrequencyStep;
    }

    return value * params.noiseHeight;
}

double billowed(const glm::dvec3& p, const GradientTableView& table,
                const NoiseParams& params) {
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = params.frequency;

    for (int i = 0; i < table.octaveCount(); ++i) {
        const double signal = std::abs(octaveNoise(p, i, table, frequency));
        value += amplitude * (2.0 * signal - 1.0);
        amplitude *= params.persistence;
        frequency *= kOctaveFrequencyStep;
    }

    return value * params.noiseHeight;
}

double powerLaw(const glm::dvec3& p, const GradientTableView& table,
                const NoiseParams& params) {
    double value = 0.0;
    double frequency = params.frequency;

    for (int i = 0; i < table.octaveCount(); ++i) {
        const double amplitude = frequency == 0.0 ? 1.0 : std::pow(frequency, -params.slope);
        value += amplitude * octaveNoise(p, i, table, frequency);
        frequency *= kOctaveFrequencyStep;
    }

    return value * params.noiseHeight;
}

double ridged(const glm::dvec3& p, const GradientTableView& table,
              const NoiseParams& params) {
    double value = 0.0;
    double amplitude = 1.0;
    double weight = 1.0;
    double frequency = params.frequency;

    for (int i = 0; i < table.octaveCount(); ++i) {
        double signal = octaveNoise(p, i, table, frequency);
        signal = 1.0 - std::abs(signal);  // Create ridge
        signal *= signal;                 // Sharpen
        signal *= weight;                 // Weight by previous octave

        weight = std::clamp(signal * kRidgeWeightGain, 0.0, 1.0);
        value += amplitude * signal;
        amplitude *= params.persistence;
        frequency *= kOctaveFrequencyStep;
    }

    return value * params.noiseHeight;
}

// ============================================================================
// Warped models
// ============================================================================

double swiss(const glm::dvec3& p, const GradientTableView& table,
             const NoiseParams& params) {
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = params.frequency;
    glm::dvec3 derivSum(0.0);

    for (int i = 0; i < table.octaveCount(); ++i) {
        const NoiseSample n = octaveNoiseDeriv(p + params.warp * derivSum, i, table, frequency);
        const double ridge = 1.0 - std::abs(n.value);

        value += amplitude * ridge;
        derivSum -= amplitude * n.value * n.gradient;
        amplitude *= params.gain * (1.0 - std::clamp(ridge, 0.0, 1.0));
        frequency *= params.lacunarity;
    }

    return value * params.noiseHeight;
}

double jordan(const glm::dvec3& p, const GradientTableView& table,
              const NoiseParams& params) {
    const int octaves = table.octaveCount();
    if (octaves == 0) {
        return 0.0;
    }

    // Primary band
    double frequency = params.frequency;
    NoiseSample n = octaveNoiseDeriv(p, 0, table, frequency);
    glm::dvec3 dn = n.value * n.gradient;

    double value = n.value * n.value;
    glm::dvec3 warpSum = params.warp0 * dn;
    glm::dvec3 dampSum = params.damp0 * dn;

    double amplitude = params.gain0;
    double damped = amplitude / (1.0 + params.dampScale * glm::dot(dampSum, dampSum));

    // Secondary band
    for (int i = 1; i < octaves; ++i) {
        frequency *= params.lacunarity;

        // Warp is applied in lattice space, after frequency scaling
        n = gradientNoiseDeriv(p * frequency + warpSum + table.gradient(i) * kOctaveOffset);
        dn = n.value * n.gradient;

        value += damped * n.value * n.value;
        warpSum += params.warp * dn;
        dampSum += params.damp * dn;

        amplitude *= params.gain;
        damped = amplitude / (1.0 + params.dampScale * glm::dot(dampSum, dampSum));
    }

    return value * params.noiseHeight;
}

// ============================================================================
// Dispatch
// ============================================================================

double evaluateNoise(NoiseModel model, const glm::dvec3& p,
                     const GradientTableView& table, const NoiseParams& params) {
    switch (model) {
        case NoiseModel::Turbulence: return turbulence(p, table, params);
        case NoiseModel::Billowed:   return billowed(p, table, params);
        case NoiseModel::PowerLaw:   return powerLaw(p, table, params);
        case NoiseModel::Ridged:     return ridged(p, table, params);
        case NoiseModel::Swiss:      return swiss(p, table, params);
        case NoiseModel::Jordan:     return jordan(p, table, params);
    }
    return 0.0;  // unreachable
}

NoiseStatus validateNoiseRequest(std::string_view modelName, int numOctaves,
                                 const GradientTableView* table) {
    if (!parseNoiseModel(modelName)) {
        return NoiseStatus::UnknownModel;
    }
    if (table == nullptr) {
        return NoiseStatus::MissingGradientTable;
    }
    if (table->octaveCount() != numOctaves) {
        return NoiseStatus::OctaveCountMismatch;
    }
    return NoiseStatus::Ok;
}

double evaluateNoise(std::string_view modelName,
                     double x, double y, double z,
                     int numOctaves, const GradientTableView* table,
                     const NoiseParams& params) {
    if (table == nullptr || table->octaveCount() != numOctaves) {
        return 0.0;
    }
    auto model = parseNoiseModel(modelName);
    if (!model) {
        return 0.0;
    }
    return evaluateNoise(*model, glm::dvec3(x, y, z), *table, params);
}

}  // namespace terranoise
