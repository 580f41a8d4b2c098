/**
 * @file surface_noise.hpp
 * @brief Apply a noise preset across the nodes of a surface
 *
 * The caller owns node positions and elevation storage; this only reads
 * and writes through spans. Node positions are divided by the preset's
 * noise_width before evaluation, so noise_height is in the same length unit
 * as the elevation.
 */

#pragma once

#include "terranoise/noise.hpp"
#include "terranoise/noise_preset.hpp"

#include <cstddef>
#include <span>
#include <thread>
#include <utility>
#include <vector>

namespace terranoise {

/// Points per worker below which no extra thread is started
inline constexpr size_t kMinPointsPerThread = 1024;

/**
 * @brief Worker threads joined on destruction
 *
 * If starting a later worker throws, the ones already running are joined
 * while the exception unwinds instead of terminating the process.
 */
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { join(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    void reserve(size_t count) { workers_.reserve(count); }

    template <typename F, typename... Args>
    void spawn(F&& fn, Args&&... args) {
        workers_.emplace_back(std::forward<F>(fn), std::forward<Args>(args)...);
    }

    void join() {
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    [[nodiscard]] size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
};

/**
 * @brief Noise value at every node
 * @param numThreads Worker count; 0 uses the hardware concurrency
 * @throws std::invalid_argument if table.octaveCount() != preset.octaves
 */
[[nodiscard]] std::vector<double> sampleSurfaceNoise(std::span<const glm::dvec3> nodes,
                                                     const NoisePreset& preset,
                                                     const GradientTableView& table,
                                                     size_t numThreads = 0);

/**
 * @brief Add the preset's noise to each node's elevation
 * @throws std::invalid_argument if nodes and elevation differ in length, or
 *         table.octaveCount() != preset.octaves
 */
void applySurfaceNoise(std::span<const glm::dvec3> nodes, std::span<double> elevation,
                       const NoisePreset& preset, const GradientTableView& table,
                       size_t numThreads = 0);

}  // namespace terranoise
