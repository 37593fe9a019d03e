#include "rockseg/pointcloud/BoundaryFiller.hpp"
#include "rockseg/pointcloud/SpatialIndex.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"

#include <open3d/geometry/PointCloud.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iomanip>
#include <sstream>
#include <thread>

namespace rockseg {
namespace pointcloud {

namespace {

constexpr double kDegenerateDirectionNorm = 1e-12;

} // namespace

const Eigen::Vector3d BoundaryFiller::kOriginalColor(1.0, 0.0, 0.0);
const Eigen::Vector3d BoundaryFiller::kBasalColor(0.0, 1.0, 1.0);
const Eigen::Vector3d BoundaryFiller::kSynthesizedColor(0.0, 0.0, 1.0);

bool BoundaryFillSettings::validate() const {
    if (interpolationCount < 1) return false;
    if (raySamples < 1) return false;
    if (rayStart < 0.0 || rayEnd < rayStart) return false;
    if (minHitDistance < 0.0 || maxHitDistance <= minHitDistance) return false;
    if (basalFraction <= 0.0 || basalFraction > 1.0) return false;
    if (maxWorkers < 0) return false;
    return true;
}

std::string BoundaryFillSettings::toString() const {
    std::stringstream ss;
    ss << "Boundary Fill Settings:\n";
    ss << "  Interpolation count: " << interpolationCount << "\n";
    ss << "  Ray samples: " << raySamples << " in [" << rayStart << ", " << rayEnd << "]\n";
    ss << "  Hit band: (" << minHitDistance << ", " << maxHitDistance << ")\n";
    ss << "  Basal fraction: " << basalFraction << "\n";
    ss << "  Max workers: " << (maxWorkers == 0 ? std::string("auto") : std::to_string(maxWorkers));
    return ss.str();
}

std::string BoundaryFillResult::toString() const {
    std::stringstream ss;
    ss << "Boundary Fill Result:\n";
    ss << "  Basal points: " << basalPoints << " (" << processedBasalPoints << " processed)\n";
    ss << "  Rays with hit: " << rays.size() << "\n";
    ss << "  Rays without hit: " << raysWithoutHit << "\n";
    ss << "  Degenerate directions: " << skippedDegenerate << "\n";
    ss << "  Failed tasks: " << failedTasks << "\n";
    ss << "  New points: " << newPoints.size() << "\n";
    ss << "  Cancelled: " << (cancelled ? "Yes" : "No") << "\n";
    ss << "  Fill time: " << std::fixed << std::setprecision(2) << fillTimeMs << " ms";
    return ss.str();
}

BoundaryFiller::BoundaryFiller(const BoundaryFillSettings& settings)
    : settings_(settings) {}

size_t BoundaryFiller::workerCount(size_t tasks) const {
    size_t workers = settings_.maxWorkers > 0
        ? static_cast<size_t>(settings_.maxWorkers)
        : static_cast<size_t>(std::thread::hardware_concurrency());
    workers = std::max<size_t>(1, workers);
    return std::min(workers, std::max<size_t>(1, tasks));
}

BoundaryFiller::RayOutcome BoundaryFiller::castRay(size_t taskIndex,
                                                   size_t basalIndex,
                                                   const Eigen::Vector3d& centroid,
                                                   const SpatialIndex& index) const {
    RayOutcome outcome;
    outcome.taskIndex = taskIndex;

    const Eigen::Vector3d origin = index.point(basalIndex);
    Eigen::Vector3d direction = centroid - origin;
    const double length = direction.norm();
    if (length < kDegenerateDirectionNorm) {
        outcome.status = RayStatus::DEGENERATE;
        return outcome;
    }
    direction /= length;

    const int samples = settings_.raySamples;
    const double step = samples > 1
        ? (settings_.rayEnd - settings_.rayStart) / static_cast<double>(samples - 1)
        : 0.0;

    for (int j = 0; j < samples; ++j) {
        const double s = settings_.rayStart + step * static_cast<double>(j);
        const Eigen::Vector3d candidate = origin + s * direction;

        int nearest = -1;
        double distance = 0.0;
        if (!index.queryNearest(candidate, nearest, distance)) {
            outcome.status = RayStatus::FAILED;
            return outcome;
        }

        if (distance > settings_.minHitDistance && distance < settings_.maxHitDistance) {
            const Eigen::Vector3d opposite = index.point(static_cast<size_t>(nearest));
            const int n = settings_.interpolationCount;

            outcome.status = RayStatus::HIT;
            outcome.ray.basalIndex = basalIndex;
            outcome.ray.oppositeIndex = static_cast<size_t>(nearest);
            outcome.ray.points.reserve(static_cast<size_t>(n));
            for (int i = 0; i < n; ++i) {
                const double t = n > 1 ? static_cast<double>(i) / static_cast<double>(n - 1) : 0.0;
                outcome.ray.points.push_back(origin + t * (opposite - origin));
            }
            return outcome;
        }
    }

    outcome.status = RayStatus::NO_HIT;
    return outcome;
}

BoundaryFillResult BoundaryFiller::fill(const open3d::geometry::PointCloud& filtered,
                                        const std::vector<size_t>& basalIndices,
                                        const std::atomic<bool>* cancel) const {
    if (!settings_.validate()) {
        ROCKSEG_THROW(core::InvalidParameterException, "Invalid boundary fill settings:\n" + settings_.toString());
    }

    const size_t numPoints = filtered.points_.size();
    for (size_t idx : basalIndices) {
        if (idx >= numPoints) {
            ROCKSEG_THROW(core::InvalidParameterException,
                          "Basal index " + std::to_string(idx) +
                          " out of range for filtered cloud of " + std::to_string(numPoints) + " points");
        }
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    // Throws EmptyInputException for an empty cloud
    SpatialIndex index(filtered);

    BoundaryFillResult result;
    result.basalPoints = basalIndices.size();

    if (!basalIndices.empty()) {
        Eigen::Vector3d sum = Eigen::Vector3d::Zero();
        for (size_t idx : basalIndices) {
            sum += filtered.points_[idx];
        }
        result.basalCentroid = sum / static_cast<double>(basalIndices.size());
    } else {
        LOG_WARNING("[BoundaryFiller] No basal points, boundary is left open");
    }

    const size_t taskCount = settings_.basalFraction >= 1.0
        ? basalIndices.size()
        : static_cast<size_t>(std::floor(static_cast<double>(basalIndices.size()) * settings_.basalFraction));

    const size_t workers = workerCount(taskCount);
    const Eigen::Vector3d centroid = result.basalCentroid;

    LOG_INFO("[BoundaryFiller] Casting " + std::to_string(taskCount) + " rays over " +
             std::to_string(numPoints) + " points with " + std::to_string(workers) + " workers");

    // Fork: each worker pulls task indices and returns its own outcomes
    std::atomic<size_t> nextTask{0};
    std::vector<std::future<std::vector<RayOutcome>>> futures;
    futures.reserve(workers);

    for (size_t w = 0; w < workers && taskCount > 0; ++w) {
        futures.push_back(std::async(std::launch::async,
            [this, &nextTask, &basalIndices, &index, &centroid, taskCount, cancel]() {
                std::vector<RayOutcome> outcomes;
                for (;;) {
                    if (cancel && cancel->load()) {
                        break;
                    }
                    const size_t task = nextTask.fetch_add(1);
                    if (task >= taskCount) {
                        break;
                    }
                    try {
                        outcomes.push_back(castRay(task, basalIndices[task], centroid, index));
                    } catch (const std::exception& e) {
                        LOG_WARNING("[BoundaryFiller] Ray " + std::to_string(task) + " failed: " + e.what());
                        RayOutcome failed;
                        failed.taskIndex = task;
                        failed.status = RayStatus::FAILED;
                        outcomes.push_back(std::move(failed));
                    }
                }
                return outcomes;
            }));
    }

    // Join: the only synchronization point
    std::vector<RayOutcome> outcomes;
    for (auto& future : futures) {
        auto chunk = future.get();
        outcomes.insert(outcomes.end(),
                        std::make_move_iterator(chunk.begin()),
                        std::make_move_iterator(chunk.end()));
    }

    result.cancelled = cancel && cancel->load();
    if (result.cancelled) {
        LOG_WARNING("[BoundaryFiller] Cancelled after " + std::to_string(outcomes.size()) +
                    " of " + std::to_string(taskCount) + " rays, results discarded");
        return result;
    }

    std::sort(outcomes.begin(), outcomes.end(),
              [](const RayOutcome& a, const RayOutcome& b) { return a.taskIndex < b.taskIndex; });

    result.processedBasalPoints = outcomes.size();
    for (auto& outcome : outcomes) {
        switch (outcome.status) {
            case RayStatus::HIT:
                result.newPoints.insert(result.newPoints.end(),
                                        outcome.ray.points.begin(), outcome.ray.points.end());
                result.rays.push_back(std::move(outcome.ray));
                break;
            case RayStatus::NO_HIT:
                ++result.raysWithoutHit;
                break;
            case RayStatus::DEGENERATE:
                ++result.skippedDegenerate;
                LOG_DEBUG("[BoundaryFiller] Basal point " + std::to_string(basalIndices[outcome.taskIndex]) +
                          " coincides with the basal centroid, skipped");
                break;
            case RayStatus::FAILED:
                ++result.failedTasks;
                break;
        }
    }

    // Assemble augmented cloud, tagging diagnostic colors
    auto augmented = std::make_shared<open3d::geometry::PointCloud>();
    augmented->points_.reserve(numPoints + result.newPoints.size());
    augmented->points_ = filtered.points_;
    augmented->points_.insert(augmented->points_.end(), result.newPoints.begin(), result.newPoints.end());
    augmented->colors_.assign(numPoints, kOriginalColor);
    // Only basal points that cast a ray
    for (size_t task = 0; task < taskCount; ++task) {
        augmented->colors_[basalIndices[task]] = kBasalColor;
    }
    augmented->colors_.resize(augmented->points_.size(), kSynthesizedColor);
    result.augmentedCloud = augmented;

    auto endTime = std::chrono::high_resolution_clock::now();
    result.fillTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    ROCKSEG_LOG_INFO("BoundaryFiller") << result.rays.size() << " rays hit, "
                                       << result.newPoints.size() << " points synthesized ("
                                       << result.fillTimeMs << " ms)";
    return result;
}

} // namespace pointcloud
} // namespace rockseg
