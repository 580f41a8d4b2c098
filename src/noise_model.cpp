#include "terranoise/noise_model.hpp"

namespace terranoise {

std::string_view noiseModelName(NoiseModel model) {
    switch (model) {
        case NoiseModel::Turbulence: return "turbulence";
        case NoiseModel::Billowed:   return "billowed";
        case NoiseModel::PowerLaw:   return "plaw";
        case NoiseModel::Ridged:     return "ridged";
        case NoiseModel::Swiss:      return "swiss";
        case NoiseModel::Jordan:     return "jordan";
    }
    return "unknown";  // unreachable
}

std::optional<NoiseModel> parseNoiseModel(std::string_view name) {
    for (NoiseModel model : kAllNoiseModels) {
        if (noiseModelName(model) == name) {
            return model;
        }
    }
    return std::nullopt;
}

NoiseParams defaultNoiseParams(NoiseModel model) {
    NoiseParams params;
    params.noiseHeight = 20e3;

    switch (model) {
        case NoiseModel::Turbulence:
        case NoiseModel::Billowed:
        case NoiseModel::Ridged:
            params.frequency = 2.0;
            params.persistence = 0.5;
            break;
        case NoiseModel::PowerLaw:
            params.frequency = 2.0;
            params.persistence = 0.5;
            params.slope = 2.0;
            break;
        case NoiseModel::Swiss:
            params.lacunarity = 1.92;
            params.gain = 0.5;
            params.warp = 0.35;
            break;
        case NoiseModel::Jordan:
            params.lacunarity = 1.92;
            params.gain = 0.5;
            params.warp = 0.35;
            params.gain0 = 70.0;
            params.warp0 = 0.4;
            params.damp0 = 1.0;
            params.damp = 0.8;
            params.dampScale = 0.01;
            break;
    }
    return params;
}

std::string_view noiseStatusMessage(NoiseStatus status) {
    switch (status) {
        case NoiseStatus::Ok:                   return "ok";
        case NoiseStatus::UnknownModel:         return "unknown noise model";
        case NoiseStatus::MissingGradientTable: return "gradient table is absent";
        case NoiseStatus::OctaveCountMismatch:  return "octave count does not match gradient table";
    }
    return "unknown status";  // unreachable
}

}  // namespace terranoise
