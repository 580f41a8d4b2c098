#include "terranoise/surface_noise.hpp"
#include "terranoise/noise_ops.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

namespace terranoise {

namespace {

/// Evaluate nodes[begin, end) into out[begin, end)
void evaluateRange(std::span<const glm::dvec3> nodes, std::span<double> out,
                   size_t begin, size_t end, const NoisePreset& preset,
                   const GradientTableView& table) {
    const double invWidth = 1.0 / preset.noiseWidth;
    for (size_t i = begin; i < end; ++i) {
        out[i] = evaluateNoise(preset.model, nodes[i] * invWidth, table, preset.params);
    }
}

size_t workerCount(size_t numPoints, size_t requested) {
    size_t numThreads = requested;
    if (numThreads == 0) {
        numThreads = std::max(1u, std::thread::hardware_concurrency());
    }
    size_t byWork = std::max<size_t>(1, numPoints / kMinPointsPerThread);
    return std::min(numThreads, byWork);
}

}  // namespace

std::vector<double> sampleSurfaceNoise(std::span<const glm::dvec3> nodes,
                                       const NoisePreset& preset,
                                       const GradientTableView& table,
                                       size_t numThreads) {
    if (table.octaveCount() != preset.octaves) {
        throw std::invalid_argument("sampleSurfaceNoise: gradient table has " +
                                    std::to_string(table.octaveCount()) + " octaves, preset expects " +
                                    std::to_string(preset.octaves));
    }

    std::vector<double> values(nodes.size(), 0.0);
    std::span<double> out(values);

    size_t threads = workerCount(nodes.size(), numThreads);
    if (threads <= 1) {
        evaluateRange(nodes, out, 0, nodes.size(), preset, table);
    } else {
        // Contiguous, disjoint slices; the table is shared read-only
        WorkerGroup workers;
        workers.reserve(threads);
        size_t chunk = (nodes.size() + threads - 1) / threads;
        for (size_t t = 0; t < threads; ++t) {
            size_t begin = t * chunk;
            size_t end = std::min(nodes.size(), begin + chunk);
            if (begin >= end) break;
            workers.spawn(evaluateRange, nodes, out, begin, end,
                          std::cref(preset), std::cref(table));
        }
        workers.join();
    }

    auto nonFinite = std::count_if(values.begin(), values.end(),
                                   [](double v) { return !std::isfinite(v); });
    if (nonFinite > 0) {
        std::cerr << "[SurfaceNoise] " << nonFinite << " of " << values.size()
                  << " samples are not finite (model " << noiseModelName(preset.model) << ")\n";
    }

    return values;
}

void applySurfaceNoise(std::span<const glm::dvec3> nodes, std::span<double> elevation,
                       const NoisePreset& preset, const GradientTableView& table,
                       size_t numThreads) {
    if (nodes.size() != elevation.size()) {
        throw std::invalid_argument("applySurfaceNoise: " + std::to_string(nodes.size()) +
                                    " nodes but " + std::to_string(elevation.size()) +
                                    " elevation values");
    }

    auto noise = sampleSurfaceNoise(nodes, preset, table, numThreads);
    for (size_t i = 0; i < elevation.size(); ++i) {
        elevation[i] += noise[i];
    }
}

}  // namespace terranoise
