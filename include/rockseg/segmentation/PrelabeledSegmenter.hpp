#pragma once

#include "rockseg/segmentation/Segmenter.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace rockseg {
namespace pointcloud {
class SpatialIndex;
}

namespace segmentation {

/**
 * @brief Segmenter that reuses labels produced by an earlier run
 *
 * Holds a labeled reference cloud. segment() gives every point the label of
 * its nearest reference point, so the cloud being segmented may be a
 * downsampled or recentered-identical copy of the reference. Seeds are only
 * checked for consistency with the transferred labels.
 */
class PrelabeledSegmenter : public Segmenter {
public:
    /**
     * @throws core::EmptyInputException if @p reference is empty
     * @throws core::InvalidParameterException if @p labels does not match @p reference
     */
    PrelabeledSegmenter(const open3d::geometry::PointCloud& reference,
                        const std::vector<core::Label>& labels);

    ~PrelabeledSegmenter() override;

    /**
     * @brief Build from the intensity channel of an exported record set
     *
     * 0 is pedestal, 1 is rock, any other value is unlabeled.
     */
    static std::unique_ptr<PrelabeledSegmenter> fromIntensity(
        const open3d::geometry::PointCloud& reference,
        const std::vector<uint16_t>& intensity);

    SegmentationOutput segment(const open3d::geometry::PointCloud& cloud,
                               const std::vector<size_t>& rockSeeds,
                               const std::vector<size_t>& pedestalSeeds,
                               const SegmentationThresholds& thresholds,
                               const core::BasalMask* basal) override;

    /**
     * @brief Unlabeled points take the label of their nearest labeled point
     */
    core::LabelArray propagateLabels(const open3d::geometry::PointCloud& cloud,
                                     const core::LabelArray& labels) override;

    std::string name() const override { return "PrelabeledSegmenter"; }

    size_t referenceSize() const { return labels_.size(); }

private:
    std::vector<core::Label> labels_;
    std::unique_ptr<pointcloud::SpatialIndex> index_;
};

} // namespace segmentation
} // namespace rockseg
