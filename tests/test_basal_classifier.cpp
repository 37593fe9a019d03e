/**
 * @file test_basal_classifier.cpp
 * @brief Unit tests for BasalClassifier
 *
 * Validates on 100 collinear points (pedestal below z = 0, rock above), k = 10:
 * - tau = 0.5 marks nothing, tau = 0 marks everything
 * - Basal sets shrink as tau grows
 * - Only the rock/pedestal transition is basal at the default tau
 * - Parameter and size validation
 */

#include <gtest/gtest.h>
#include <rockseg/pointcloud/BasalClassifier.hpp>
#include <rockseg/core/exception.h>

#include <open3d/geometry/PointCloud.h>

#include <vector>

using namespace rockseg;
using namespace rockseg::pointcloud;

class BasalClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 100; ++i) {
            const double z = (i - 50) * 0.01;
            cloud_.points_.emplace_back(0.0, 0.0, z);
            labels_.labels.push_back(z < 0.0 ? core::Label::PEDESTAL : core::Label::ROCK);
        }
    }

    core::BasalMask classify(double tau, int k = 10) const {
        BasalSettings settings;
        settings.neighbors = k;
        settings.mixtureThreshold = tau;
        return BasalClassifier(settings).classify(cloud_, labels_);
    }

    open3d::geometry::PointCloud cloud_;
    core::LabelArray labels_;
};

TEST_F(BasalClassifierTest, HalfThresholdMarksNothing) {
    core::BasalMask mask = classify(0.5);
    ASSERT_EQ(mask.size(), 100u);
    EXPECT_EQ(mask.count(), 0u);
}

TEST_F(BasalClassifierTest, ZeroThresholdMarksEverything) {
    core::BasalMask mask = classify(0.0);
    ASSERT_EQ(mask.size(), 100u);
    EXPECT_EQ(mask.count(), 100u);
}

TEST_F(BasalClassifierTest, BasalSetShrinksAsThresholdGrows) {
    const std::vector<double> taus = {0.0, 0.1, 0.2, 0.3, 0.35, 0.4, 0.45, 0.5};
    std::vector<core::BasalMask> masks;
    for (double tau : taus) {
        masks.push_back(classify(tau));
    }

    for (size_t a = 0; a < masks.size(); ++a) {
        for (size_t b = a + 1; b < masks.size(); ++b) {
            for (size_t i = 0; i < 100; ++i) {
                if (masks[b].mask[i]) {
                    EXPECT_TRUE(masks[a].mask[i])
                        << "point " << i << " basal at tau=" << taus[b] << " but not at tau=" << taus[a];
                }
            }
        }
    }
}

TEST_F(BasalClassifierTest, TransitionIsBasalAtDefaultThreshold) {
    core::BasalMask mask = classify(0.35);
    EXPECT_TRUE(mask.mask[49]);
    EXPECT_TRUE(mask.mask[50]);
    EXPECT_FALSE(mask.mask[0]);
    EXPECT_FALSE(mask.mask[99]);

    // Basal points stay close to the label boundary
    for (size_t i : mask.indices()) {
        EXPECT_GE(i, 40u);
        EXPECT_LE(i, 60u);
    }
}

TEST_F(BasalClassifierTest, MaskCarriesLabelGeneration) {
    labels_.generation = 7;
    core::BasalMask mask = classify(0.35);
    EXPECT_EQ(mask.generation, 7u);
}

TEST_F(BasalClassifierTest, ThresholdOutOfRangeThrows) {
    EXPECT_THROW(classify(0.6), core::InvalidParameterException);
    EXPECT_THROW(classify(-0.1), core::InvalidParameterException);
    EXPECT_THROW(classify(0.35, 0), core::InvalidParameterException);
}

TEST_F(BasalClassifierTest, LabelSizeMismatchThrows) {
    labels_.labels.pop_back();
    EXPECT_THROW(classify(0.35), core::InvalidParameterException);
}

TEST(BasalClassifierEmptyTest, EmptyCloudThrows) {
    open3d::geometry::PointCloud cloud;
    core::LabelArray labels;
    BasalClassifier classifier;
    EXPECT_THROW(classifier.classify(cloud, labels), core::EmptyInputException);
}
