/**
 * @file test_prelabeled_segmenter.cpp
 * @brief Unit tests for PrelabeledSegmenter and Segmenter::colorByLabel
 *
 * Validates:
 * - Intensity to label mapping
 * - Nearest-neighbor label transfer onto a shifted cloud
 * - Label coloring
 * - Propagation to unlabeled points
 */

#include <gtest/gtest.h>
#include <rockseg/segmentation/PrelabeledSegmenter.hpp>
#include <rockseg/core/exception.h>

#include <open3d/geometry/PointCloud.h>

#include <vector>

using namespace rockseg;
using namespace rockseg::segmentation;

class PrelabeledSegmenterTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Ten points on the x axis, left half pedestal, right half rock
        for (int i = 0; i < 10; ++i) {
            reference_.points_.emplace_back(static_cast<double>(i), 0.0, 0.0);
            intensity_.push_back(i < 5 ? 0 : 1);
        }
    }

    open3d::geometry::PointCloud reference_;
    std::vector<uint16_t> intensity_;
};

TEST_F(PrelabeledSegmenterTest, IntensityMapping) {
    intensity_[3] = 2;
    auto segmenter = PrelabeledSegmenter::fromIntensity(reference_, intensity_);
    ASSERT_TRUE(segmenter);
    EXPECT_EQ(segmenter->referenceSize(), 10u);

    SegmentationOutput out = segmenter->segment(reference_, {9}, {0}, SegmentationThresholds(), nullptr);
    ASSERT_EQ(out.labels.size(), 10u);
    EXPECT_EQ(out.labels.labels[0], core::Label::PEDESTAL);
    EXPECT_EQ(out.labels.labels[3], core::Label::UNLABELED);
    EXPECT_EQ(out.labels.labels[4], core::Label::PEDESTAL);
    EXPECT_EQ(out.labels.labels[5], core::Label::ROCK);
    EXPECT_EQ(out.labels.labels[9], core::Label::ROCK);
}

TEST_F(PrelabeledSegmenterTest, TransferToShiftedCloud) {
    auto segmenter = PrelabeledSegmenter::fromIntensity(reference_, intensity_);

    open3d::geometry::PointCloud query;
    for (int i = 0; i < 10; ++i) {
        query.points_.emplace_back(i + 0.1, 0.0, 0.0);
    }

    SegmentationOutput out = segmenter->segment(query, {9}, {0}, SegmentationThresholds(), nullptr);
    ASSERT_EQ(out.labels.size(), query.points_.size());
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(out.labels.labels[i], i < 5 ? core::Label::PEDESTAL : core::Label::ROCK) << "point " << i;
    }
    EXPECT_EQ(out.labels.count(core::Label::ROCK), 5u);
    EXPECT_EQ(out.labels.count(core::Label::PEDESTAL), 5u);
}

TEST_F(PrelabeledSegmenterTest, BasalMaskLeavesLabelsUnchanged) {
    auto segmenter = PrelabeledSegmenter::fromIntensity(reference_, intensity_);

    core::BasalMask basal;
    basal.mask.assign(10, false);
    basal.mask[4] = true;
    basal.mask[5] = true;

    SegmentationOutput out = segmenter->segment(reference_, {9}, {0}, SegmentationThresholds(), &basal);
    ASSERT_EQ(out.labels.size(), 10u);
    EXPECT_EQ(out.labels.labels[4], core::Label::PEDESTAL);
    EXPECT_EQ(out.labels.labels[5], core::Label::ROCK);
}

TEST_F(PrelabeledSegmenterTest, LabeledCloudIsColored) {
    auto segmenter = PrelabeledSegmenter::fromIntensity(reference_, intensity_);
    SegmentationOutput out = segmenter->segment(reference_, {9}, {0}, SegmentationThresholds(), nullptr);

    ASSERT_TRUE(out.labeledCloud);
    ASSERT_EQ(out.labeledCloud->points_.size(), reference_.points_.size());
    ASSERT_TRUE(out.labeledCloud->HasColors());
    EXPECT_EQ(out.labeledCloud->colors_[0], Segmenter::kPedestalColor);
    EXPECT_EQ(out.labeledCloud->colors_[9], Segmenter::kRockColor);
    EXPECT_EQ(out.labeledCloud->points_[9], reference_.points_[9]);
}

TEST_F(PrelabeledSegmenterTest, ColorByLabelSizeMismatchThrows) {
    auto segmenter = PrelabeledSegmenter::fromIntensity(reference_, intensity_);
    core::LabelArray labels;
    labels.labels.assign(3, core::Label::ROCK);
    EXPECT_THROW(segmenter->colorByLabel(reference_, labels), core::InvalidParameterException);

    labels.labels.assign(10, core::Label::UNLABELED);
    auto colored = segmenter->colorByLabel(reference_, labels);
    EXPECT_EQ(colored->colors_[4], Segmenter::kUnlabeledColor);
}

TEST_F(PrelabeledSegmenterTest, PropagateFillsUnlabeledPoints) {
    auto segmenter = PrelabeledSegmenter::fromIntensity(reference_, intensity_);

    core::LabelArray labels;
    labels.labels.assign(10, core::Label::UNLABELED);
    labels.labels[1] = core::Label::PEDESTAL;
    labels.labels[8] = core::Label::ROCK;
    labels.generation = 4;

    core::LabelArray result = segmenter->propagateLabels(reference_, labels);
    ASSERT_EQ(result.size(), 10u);
    EXPECT_EQ(result.generation, 4u);
    EXPECT_EQ(result.count(core::Label::UNLABELED), 0u);
    EXPECT_EQ(result.labels[0], core::Label::PEDESTAL);
    EXPECT_EQ(result.labels[4], core::Label::PEDESTAL);
    EXPECT_EQ(result.labels[5], core::Label::ROCK);
    EXPECT_EQ(result.labels[9], core::Label::ROCK);
}

TEST_F(PrelabeledSegmenterTest, PropagateWithoutLabelsIsNoOp) {
    auto segmenter = PrelabeledSegmenter::fromIntensity(reference_, intensity_);
    core::LabelArray labels;
    labels.labels.assign(10, core::Label::UNLABELED);

    core::LabelArray result = segmenter->propagateLabels(reference_, labels);
    EXPECT_EQ(result.count(core::Label::UNLABELED), 10u);

    labels.labels.pop_back();
    EXPECT_THROW(segmenter->propagateLabels(reference_, labels), core::InvalidParameterException);
}

TEST_F(PrelabeledSegmenterTest, ReferenceWithoutLabelsThrows) {
    std::vector<uint16_t> unlabeled(10, 7);
    auto segmenter = PrelabeledSegmenter::fromIntensity(reference_, unlabeled);
    EXPECT_THROW(segmenter->segment(reference_, {9}, {0}, SegmentationThresholds(), nullptr),
                 core::DegenerateGeometryException);
}

TEST_F(PrelabeledSegmenterTest, InvalidReferenceThrows) {
    intensity_.pop_back();
    EXPECT_THROW(PrelabeledSegmenter::fromIntensity(reference_, intensity_), core::InvalidParameterException);

    open3d::geometry::PointCloud empty;
    EXPECT_THROW(PrelabeledSegmenter::fromIntensity(empty, {}), core::EmptyInputException);
}
