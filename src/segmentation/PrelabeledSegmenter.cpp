#include "rockseg/segmentation/PrelabeledSegmenter.hpp"
#include "rockseg/pointcloud/SpatialIndex.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"

#include <open3d/geometry/PointCloud.h>

namespace rockseg {
namespace segmentation {

PrelabeledSegmenter::PrelabeledSegmenter(const open3d::geometry::PointCloud& reference,
                                         const std::vector<core::Label>& labels)
    : labels_(labels) {
    if (labels.size() != reference.points_.size()) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Reference label count " + std::to_string(labels.size()) +
                      " does not match point count " + std::to_string(reference.points_.size()));
    }
    // Throws EmptyInputException for an empty reference
    index_ = std::make_unique<pointcloud::SpatialIndex>(reference);
}

PrelabeledSegmenter::~PrelabeledSegmenter() = default;

std::unique_ptr<PrelabeledSegmenter> PrelabeledSegmenter::fromIntensity(
    const open3d::geometry::PointCloud& reference,
    const std::vector<uint16_t>& intensity) {

    std::vector<core::Label> labels;
    labels.reserve(intensity.size());
    for (uint16_t value : intensity) {
        if (value == 0) {
            labels.push_back(core::Label::PEDESTAL);
        } else if (value == 1) {
            labels.push_back(core::Label::ROCK);
        } else {
            labels.push_back(core::Label::UNLABELED);
        }
    }
    return std::make_unique<PrelabeledSegmenter>(reference, labels);
}

SegmentationOutput PrelabeledSegmenter::segment(const open3d::geometry::PointCloud& cloud,
                                                const std::vector<size_t>& rockSeeds,
                                                const std::vector<size_t>& pedestalSeeds,
                                                const SegmentationThresholds& thresholds,
                                                const core::BasalMask* basal) {
    (void)thresholds;
    // Labels come from the reference, a basal mask cannot move them
    if (basal) {
        LOG_DEBUG("[PrelabeledSegmenter] Ignoring basal mask of " + std::to_string(basal->count()) + " points");
    }

    size_t labeledReference = 0;
    for (core::Label label : labels_) {
        if (label != core::Label::UNLABELED) {
            ++labeledReference;
        }
    }
    if (labeledReference == 0) {
        ROCKSEG_THROW(core::DegenerateGeometryException,
                      "Reference cloud carries no rock or pedestal label");
    }

    core::LabelArray labels;
    labels.labels.resize(cloud.points_.size(), core::Label::UNLABELED);

    for (size_t i = 0; i < cloud.points_.size(); ++i) {
        int nearest = -1;
        double distance = 0.0;
        if (index_->queryNearest(cloud.points_[i], nearest, distance)) {
            labels.labels[i] = labels_[static_cast<size_t>(nearest)];
        }
    }

    for (size_t seed : rockSeeds) {
        if (seed < labels.size() && labels.labels[seed] != core::Label::ROCK) {
            LOG_WARNING("[PrelabeledSegmenter] Rock seed " + std::to_string(seed) + " carries label " +
                        core::labelToString(labels.labels[seed]));
        }
    }
    for (size_t seed : pedestalSeeds) {
        if (seed < labels.size() && labels.labels[seed] != core::Label::PEDESTAL) {
            LOG_WARNING("[PrelabeledSegmenter] Pedestal seed " + std::to_string(seed) + " carries label " +
                        core::labelToString(labels.labels[seed]));
        }
    }

    SegmentationOutput output;
    output.labeledCloud = colorByLabel(cloud, labels);
    output.labels = std::move(labels);

    ROCKSEG_LOG_INFO("PrelabeledSegmenter") << "Transferred labels to " << cloud.points_.size()
                                            << " points: " << output.labels.count(core::Label::ROCK)
                                            << " rock, " << output.labels.count(core::Label::PEDESTAL)
                                            << " pedestal";
    return output;
}

core::LabelArray PrelabeledSegmenter::propagateLabels(const open3d::geometry::PointCloud& cloud,
                                                      const core::LabelArray& labels) {
    if (labels.size() != cloud.points_.size()) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Label count " + std::to_string(labels.size()) +
                      " does not match point count " + std::to_string(cloud.points_.size()));
    }

    std::vector<Eigen::Vector3d> labeledPoints;
    std::vector<core::Label> labeledValues;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels.labels[i] != core::Label::UNLABELED) {
            labeledPoints.push_back(cloud.points_[i]);
            labeledValues.push_back(labels.labels[i]);
        }
    }

    core::LabelArray result = labels;
    if (labeledPoints.empty() || labeledPoints.size() == labels.size()) {
        return result;
    }

    pointcloud::SpatialIndex labeledIndex(labeledPoints);
    size_t propagated = 0;
    for (size_t i = 0; i < result.size(); ++i) {
        if (result.labels[i] != core::Label::UNLABELED) {
            continue;
        }
        int nearest = -1;
        double distance = 0.0;
        if (labeledIndex.queryNearest(cloud.points_[i], nearest, distance)) {
            result.labels[i] = labeledValues[static_cast<size_t>(nearest)];
            ++propagated;
        }
    }

    LOG_DEBUG("[PrelabeledSegmenter] Propagated labels to " + std::to_string(propagated) + " points");
    return result;
}

} // namespace segmentation
} // namespace rockseg
