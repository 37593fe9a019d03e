/**
 * @file test_seed_heuristic.cpp
 * @brief Unit tests for SeedHeuristic
 *
 * Validates:
 * - Apex / lowest point selection
 * - First-index tie breaking
 * - Degenerate (coincident) clouds
 * - Seed set validation
 * - Index list parsing and transfer onto a downsampled cloud
 */

#include <gtest/gtest.h>
#include <rockseg/pointcloud/SeedHeuristic.hpp>
#include <rockseg/core/exception.h>

#include <open3d/geometry/PointCloud.h>

#include <cmath>
#include <vector>

using namespace rockseg;
using namespace rockseg::pointcloud;

TEST(SeedHeuristicTest, ApexAndLowestPoint) {
    open3d::geometry::PointCloud cloud;
    cloud.points_ = {
        Eigen::Vector3d(1.0, 0.0, 0.0),
        Eigen::Vector3d(-1.0, 0.0, -0.5),
        Eigen::Vector3d(0.0, 0.0, 1.0),     // apex, on the xy center
        Eigen::Vector3d(0.0, 1.0, -0.5),    // ties index 1 on z
        Eigen::Vector3d(0.0, -1.0, 0.0)
    };

    DefaultSeeds seeds = SeedHeuristic::compute(cloud);
    EXPECT_EQ(seeds.rockSeed, 2u);
    EXPECT_EQ(seeds.pedestalSeed, 1u);
}

TEST(SeedHeuristicTest, HighOffCenterPointLosesToCentralPoint) {
    open3d::geometry::PointCloud cloud;
    cloud.points_ = {
        Eigen::Vector3d(-2.0, 0.0, 0.0),
        Eigen::Vector3d(2.0, 0.0, 0.0),
        Eigen::Vector3d(1.9, 0.0, 1.5),     // score 1.5 - 1.9 = -0.4
        Eigen::Vector3d(0.1, 0.0, 1.0)      // score 1.0 - 0.1 = 0.9
    };

    DefaultSeeds seeds = SeedHeuristic::compute(cloud);
    EXPECT_EQ(seeds.rockSeed, 3u);
}

TEST(SeedHeuristicTest, SeedsWithinRange) {
    open3d::geometry::PointCloud cloud;
    for (int i = 0; i < 50; ++i) {
        cloud.points_.emplace_back(std::cos(i * 0.3), std::sin(i * 0.3), 0.01 * (i % 11));
    }
    DefaultSeeds seeds = SeedHeuristic::compute(cloud);
    EXPECT_LT(seeds.rockSeed, cloud.points_.size());
    EXPECT_LT(seeds.pedestalSeed, cloud.points_.size());

    for (const auto& p : cloud.points_) {
        EXPECT_GE(p.z(), cloud.points_[seeds.pedestalSeed].z());
    }
}

TEST(SeedHeuristicTest, CoincidentPointsYieldFirstIndex) {
    open3d::geometry::PointCloud cloud;
    cloud.points_.assign(8, Eigen::Vector3d(0.3, -0.2, 0.7));

    DefaultSeeds seeds = SeedHeuristic::compute(cloud);
    EXPECT_EQ(seeds.rockSeed, 0u);
    EXPECT_EQ(seeds.pedestalSeed, 0u);
}

TEST(SeedHeuristicTest, EmptyCloudThrows) {
    open3d::geometry::PointCloud cloud;
    EXPECT_THROW(SeedHeuristic::compute(cloud), core::EmptyInputException);
}

TEST(SeedHeuristicTest, ValidateSeedSet) {
    core::SeedSet seeds;
    seeds.rock = {0};
    seeds.pedestal = {4};
    EXPECT_NO_THROW(SeedHeuristic::validate(seeds, 5));

    seeds.pedestal = {5};
    EXPECT_THROW(SeedHeuristic::validate(seeds, 5), core::InvalidSeedException);

    seeds.pedestal.clear();
    EXPECT_THROW(SeedHeuristic::validate(seeds, 5), core::InvalidSeedException);

    seeds.pedestal = {1};
    seeds.rock.clear();
    EXPECT_THROW(SeedHeuristic::validate(seeds, 5), core::InvalidSeedException);
}

TEST(SeedHeuristicTest, InvalidSeedCarriesResultCode) {
    core::SeedSet seeds;
    seeds.rock = {10};
    seeds.pedestal = {0};
    try {
        SeedHeuristic::validate(seeds, 3);
        FAIL() << "Expected InvalidSeedException";
    } catch (const core::Exception& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_INVALID_SEED);
        EXPECT_NE(e.getMessage().find("10"), std::string::npos);
    }
}

TEST(SeedHeuristicTest, ParseIndexList) {
    EXPECT_EQ(SeedHeuristic::parseIndexList("12"), (std::vector<size_t>{12}));
    EXPECT_EQ(SeedHeuristic::parseIndexList("12,40, 7 "), (std::vector<size_t>{12, 40, 7}));

    EXPECT_THROW(SeedHeuristic::parseIndexList(""), core::InvalidSeedException);
    EXPECT_THROW(SeedHeuristic::parseIndexList("3,,4"), core::InvalidSeedException);
    EXPECT_THROW(SeedHeuristic::parseIndexList("-1"), core::InvalidSeedException);
    EXPECT_THROW(SeedHeuristic::parseIndexList("4,apex"), core::InvalidSeedException);
}

TEST(SeedHeuristicTest, TransferToNearestPoints) {
    open3d::geometry::PointCloud full;
    for (int i = 0; i < 10; ++i) {
        full.points_.emplace_back(i * 0.1, 0.0, 0.0);
    }

    // Every other point survives, slightly displaced
    open3d::geometry::PointCloud reduced;
    for (int i = 0; i < 10; i += 2) {
        reduced.points_.emplace_back(i * 0.1 + 0.01, 0.0, 0.0);
    }

    std::vector<size_t> mapped = SeedHeuristic::transfer(full, {8, 0, 9}, reduced);
    ASSERT_EQ(mapped.size(), 2u);
    EXPECT_EQ(mapped[0], 4u);
    EXPECT_EQ(mapped[1], 0u);

    EXPECT_THROW(SeedHeuristic::transfer(full, {10}, reduced), core::InvalidSeedException);
    EXPECT_THROW(SeedHeuristic::transfer(full, {1}, open3d::geometry::PointCloud()), core::EmptyInputException);
}
