#pragma once

#include "rockseg/core/types.hpp"

#include <Eigen/Core>

#include <memory>
#include <string>
#include <vector>

namespace open3d {
namespace geometry {
class PointCloud;
}
}

namespace rockseg {
namespace segmentation {

/**
 * @brief Region growing thresholds
 */
struct SegmentationThresholds {
    double smoothness = 0.99;           // Normal similarity, [0, 1]
    double curvature = 0.15;            // Curvature limit, [0, 1]
    double distance = 0.05;             // Neighborhood distance, > 0
    double basalProximity = 0.05;       // Growth stops this close to a basal point, [0, 1]

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief Segmentation output
 *
 * labels has one entry per point of the segmented cloud.
 */
struct SegmentationOutput {
    std::shared_ptr<const open3d::geometry::PointCloud> labeledCloud;
    core::LabelArray labels;
};

/**
 * @brief Rock / pedestal segmentation collaborator
 *
 * Implementations may throw any std::exception; the pipeline rethrows it as
 * core::ExternalComponentException with the original message.
 */
class Segmenter {
public:
    static const Eigen::Vector3d kRockColor;
    static const Eigen::Vector3d kPedestalColor;
    static const Eigen::Vector3d kUnlabeledColor;

    virtual ~Segmenter() = default;

    /**
     * @brief Grow rock and pedestal regions from the seeds
     * @param basal Basal mask of @p cloud from a previous pass, or null on the
     *        first pass. Growth should not pass within
     *        thresholds.basalProximity of a basal point.
     */
    virtual SegmentationOutput segment(const open3d::geometry::PointCloud& cloud,
                                       const std::vector<size_t>& rockSeeds,
                                       const std::vector<size_t>& pedestalSeeds,
                                       const SegmentationThresholds& thresholds,
                                       const core::BasalMask* basal) = 0;

    /**
     * @brief Assign labels to points left unlabeled by segment()
     */
    virtual core::LabelArray propagateLabels(const open3d::geometry::PointCloud& cloud,
                                             const core::LabelArray& labels) = 0;

    /**
     * @brief Copy of @p cloud painted by label
     *
     * Rock red, pedestal blue, unlabeled gray.
     */
    virtual std::shared_ptr<open3d::geometry::PointCloud> colorByLabel(
        const open3d::geometry::PointCloud& cloud,
        const core::LabelArray& labels) const;

    virtual std::string name() const = 0;
};

} // namespace segmentation
} // namespace rockseg
