#pragma once

#include "rockseg/core/types.hpp"

#include <string>

namespace open3d {
namespace geometry {
class PointCloud;
}
}

namespace rockseg {
namespace pointcloud {

/**
 * @brief Basal point classification settings
 */
struct BasalSettings {
    int neighbors = 30;                 // k, query point included
    double mixtureThreshold = 0.35;     // tau in [0, 0.5]

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief Marks points whose neighborhood mixes rock and pedestal labels
 *
 * A point is basal iff tau <= rockRatio <= 1 - tau, where rockRatio is the
 * share of Rock labels among its k nearest neighbors (divided by k). tau = 0
 * marks every point; tau = 0.5 is treated as an empty band and marks none.
 */
class BasalClassifier {
public:
    explicit BasalClassifier(const BasalSettings& settings = {});

    /**
     * @brief Classify every point of @p cloud
     * @throws core::InvalidParameterException on invalid settings or label count mismatch
     * @throws core::EmptyInputException for an empty cloud
     */
    core::BasalMask classify(const open3d::geometry::PointCloud& cloud,
                             const core::LabelArray& labels) const;

    const BasalSettings& settings() const { return settings_; }

private:
    BasalSettings settings_;
};

} // namespace pointcloud
} // namespace rockseg
