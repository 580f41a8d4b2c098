/**
 * @file noise_sample.cpp
 * @brief Evaluate a noise preset over a sphere and print summary statistics
 *
 * Usage: terranoise_sample <preset-file> [radius] [resolution]
 *
 * radius defaults to 1737.4e3 (lunar radius, metres); resolution is the
 * number of latitude rows (longitude uses twice as many columns).
 */

#include <terranoise/noise_preset.hpp>
#include <terranoise/surface_noise.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <numbers>
#include <numeric>
#include <string>
#include <vector>

using namespace terranoise;

namespace {

/// Nodes of a latitude/longitude grid on a sphere
std::vector<glm::dvec3> sphereNodes(double radius, int rows) {
    const int cols = rows * 2;
    std::vector<glm::dvec3> nodes;
    nodes.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols));

    for (int r = 0; r < rows; ++r) {
        double lat = std::numbers::pi * ((r + 0.5) / rows - 0.5);
        for (int c = 0; c < cols; ++c) {
            double lon = 2.0 * std::numbers::pi * c / cols;
            nodes.emplace_back(radius * std::cos(lat) * std::cos(lon),
                               radius * std::cos(lat) * std::sin(lon),
                               radius * std::sin(lat));
        }
    }
    return nodes;
}

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <preset-file> [radius] [resolution]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 4) {
        printUsage(argv[0]);
        return 1;
    }

    auto preset = loadNoisePresetFile(argv[1]);
    if (!preset) {
        return 1;
    }

    double radius = 1737.4e3;
    int rows = 90;
    if (argc > 2) {
        char* end;
        radius = std::strtod(argv[2], &end);
        if (end == argv[2] || !(radius > 0.0)) {
            std::cerr << "Invalid radius: " << argv[2] << "\n";
            return 1;
        }
    }
    if (argc > 3) {
        char* end;
        long value = std::strtol(argv[3], &end, 10);
        if (end == argv[3] || value < 1 || value > 10000) {
            std::cerr << "Invalid resolution: " << argv[3] << "\n";
            return 1;
        }
        rows = static_cast<int>(value);
    }

    auto table = preset->makeGradientTable();
    auto nodes = sphereNodes(radius, rows);
    std::vector<double> elevation(nodes.size(), 0.0);

    applySurfaceNoise(nodes, elevation, *preset, table.view());

    auto [minIt, maxIt] = std::minmax_element(elevation.begin(), elevation.end());
    double mean = std::accumulate(elevation.begin(), elevation.end(), 0.0) /
                  static_cast<double>(elevation.size());

    std::cout << "model:   " << noiseModelName(preset->model) << "\n"
              << "octaves: " << preset->octaves << "\n"
              << "seed:    " << preset->seed << "\n"
              << "nodes:   " << nodes.size() << "\n"
              << "min:     " << *minIt << "\n"
              << "max:     " << *maxIt << "\n"
              << "mean:    " << mean << "\n";
    return 0;
}
