#include "rockseg/segmentation/Segmenter.hpp"
#include "rockseg/core/exception.h"

#include <open3d/geometry/PointCloud.h>

#include <sstream>

namespace rockseg {
namespace segmentation {

const Eigen::Vector3d Segmenter::kRockColor(1.0, 0.0, 0.0);
const Eigen::Vector3d Segmenter::kPedestalColor(0.0, 0.0, 1.0);
const Eigen::Vector3d Segmenter::kUnlabeledColor(0.5, 0.5, 0.5);

bool SegmentationThresholds::validate() const {
    if (smoothness < 0.0 || smoothness > 1.0) return false;
    if (curvature < 0.0 || curvature > 1.0) return false;
    if (distance <= 0.0) return false;
    if (basalProximity < 0.0 || basalProximity > 1.0) return false;
    return true;
}

std::string SegmentationThresholds::toString() const {
    std::stringstream ss;
    ss << "Segmentation Thresholds:\n";
    ss << "  Smoothness: " << smoothness << "\n";
    ss << "  Curvature: " << curvature << "\n";
    ss << "  Distance: " << distance << "\n";
    ss << "  Basal proximity: " << basalProximity;
    return ss.str();
}

std::shared_ptr<open3d::geometry::PointCloud> Segmenter::colorByLabel(
    const open3d::geometry::PointCloud& cloud,
    const core::LabelArray& labels) const {

    if (labels.size() != cloud.points_.size()) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Label count " + std::to_string(labels.size()) +
                      " does not match point count " + std::to_string(cloud.points_.size()));
    }

    auto colored = std::make_shared<open3d::geometry::PointCloud>(cloud);
    colored->colors_.resize(cloud.points_.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        switch (labels.labels[i]) {
            case core::Label::ROCK: colored->colors_[i] = kRockColor; break;
            case core::Label::PEDESTAL: colored->colors_[i] = kPedestalColor; break;
            case core::Label::UNLABELED: colored->colors_[i] = kUnlabeledColor; break;
        }
    }
    return colored;
}

} // namespace segmentation
} // namespace rockseg
