/**
 * @file gradient_table.cpp
 * @brief Seeded per-octave gradient tables
 */

#include "terranoise/noise.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>

namespace terranoise {

GradientTableView::GradientTableView(std::span<const double> data, int octaveCount)
    : data_(data), octaveCount_(octaveCount) {
    if (octaveCount < 0) {
        throw std::invalid_argument("GradientTableView: negative octave count");
    }
    if (data.size() != static_cast<size_t>(octaveCount) * 3) {
        throw std::invalid_argument("GradientTableView: expected " +
                                    std::to_string(static_cast<size_t>(octaveCount) * 3) + " values, got " +
                                    std::to_string(data.size()));
    }
}

GradientTable::GradientTable(const std::vector<glm::dvec3>& gradients) {
    data_.reserve(gradients.size() * 3);
    for (const auto& g : gradients) {
        data_.push_back(g.x);
        data_.push_back(g.y);
        data_.push_back(g.z);
    }
}

GradientTable GradientTable::generate(uint64_t seed, int octaveCount) {
    if (octaveCount < 0) {
        throw std::invalid_argument("GradientTable: negative octave count");
    }

    std::vector<glm::dvec3> gradients;
    gradients.reserve(static_cast<size_t>(octaveCount));

    for (int i = 0; i < octaveCount; ++i) {
        const uint64_t octaveSeed = NoiseHash::deriveSeed(seed, static_cast<uint64_t>(i));

        // Uniform direction: z uniform in [-1, 1), azimuth uniform in [0, 2pi)
        const double z = 2.0 * NoiseHash::toUnitInterval(NoiseHash::deriveSeed(octaveSeed, 1)) - 1.0;
        const double phi = 2.0 * std::numbers::pi *
                           NoiseHash::toUnitInterval(NoiseHash::deriveSeed(octaveSeed, 2));
        const double r = std::sqrt(std::max(0.0, 1.0 - z * z));

        gradients.emplace_back(r * std::cos(phi), r * std::sin(phi), z);
    }

    return GradientTable(gradients);
}

}  // namespace terranoise
