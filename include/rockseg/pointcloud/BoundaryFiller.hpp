#pragma once

#include "rockseg/core/types.hpp"

#include <Eigen/Core>

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace open3d {
namespace geometry {
class PointCloud;
}
}

namespace rockseg {
namespace pointcloud {

class SpatialIndex;

/**
 * @brief Boundary filling configuration
 *
 * Rays start at each basal point and head toward the basal centroid. The
 * first ray sample that lands near existing geometry (but not on a sampled
 * point itself) defines the opposite point; the segment between the two is
 * filled with interpolated points.
 */
struct BoundaryFillSettings {
    int interpolationCount = 10;        // Points per segment, both endpoints included
    int raySamples = 100;               // Candidate samples per ray
    double rayStart = 0.5;              // First sample distance along the ray
    double rayEnd = 2.0;                // Last sample distance along the ray
    double minHitDistance = 1e-6;       // Exclusive lower bound of a valid hit
    double maxHitDistance = 0.05;       // Exclusive upper bound of a valid hit
    double basalFraction = 1.0;         // Leading share of basal points used as ray origins
    int maxWorkers = 0;                 // Worker threads, 0 = hardware concurrency

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief One successful ray: origin, opposite point and the filled segment
 */
struct BoundaryRay {
    size_t basalIndex = 0;              // Index into the filtered cloud
    size_t oppositeIndex = 0;           // Index into the filtered cloud
    std::vector<Eigen::Vector3d> points;
};

/**
 * @brief Boundary filling result
 */
struct BoundaryFillResult {
    std::shared_ptr<const open3d::geometry::PointCloud> augmentedCloud;  // filtered + new points
    core::Generation generation = 0;    // Of augmentedCloud, assigned by the owner
    std::vector<Eigen::Vector3d> newPoints;
    std::vector<BoundaryRay> rays;      // Ordered by basal index
    Eigen::Vector3d basalCentroid = Eigen::Vector3d::Zero();

    size_t basalPoints = 0;
    size_t processedBasalPoints = 0;
    size_t skippedDegenerate = 0;
    size_t raysWithoutHit = 0;
    size_t failedTasks = 0;
    bool cancelled = false;
    double fillTimeMs = 0.0;

    std::string toString() const;
};

/**
 * @brief Synthesizes points closing the open bottom of the rock
 *
 * Each basal point is an independent task run on a bounded pool of worker
 * threads. Tasks only read the shared spatial index and centroid; the
 * results are joined once before the augmented cloud is assembled.
 */
class BoundaryFiller {
public:
    // Diagnostic colors of the augmented cloud
    static const Eigen::Vector3d kOriginalColor;
    static const Eigen::Vector3d kBasalColor;
    static const Eigen::Vector3d kSynthesizedColor;

    explicit BoundaryFiller(const BoundaryFillSettings& settings = {});

    /**
     * @brief Fill the boundary of @p filtered
     * @param filtered Rock and basal points
     * @param basalIndices Indices of the basal points within @p filtered
     * @param cancel Optional flag; once set, pending tasks are dropped
     * @throws core::EmptyInputException if @p filtered is empty
     * @throws core::InvalidParameterException on invalid settings or indices
     */
    BoundaryFillResult fill(const open3d::geometry::PointCloud& filtered,
                            const std::vector<size_t>& basalIndices,
                            const std::atomic<bool>* cancel = nullptr) const;

    const BoundaryFillSettings& settings() const { return settings_; }

private:
    enum class RayStatus {
        HIT,
        NO_HIT,
        DEGENERATE,
        FAILED
    };

    struct RayOutcome {
        size_t taskIndex = 0;
        RayStatus status = RayStatus::NO_HIT;
        BoundaryRay ray;
    };

    RayOutcome castRay(size_t taskIndex,
                       size_t basalIndex,
                       const Eigen::Vector3d& centroid,
                       const SpatialIndex& index) const;

    size_t workerCount(size_t tasks) const;

    BoundaryFillSettings settings_;
};

} // namespace pointcloud
} // namespace rockseg
