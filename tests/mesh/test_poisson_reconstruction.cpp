/**
 * @file test_poisson_reconstruction.cpp
 * @brief Integration tests for the Open3D Poisson reconstructor
 *
 * Validates:
 * - Sphere reconstruction through the full preprocessing chain
 * - Per-vertex densities stay aligned with vertices after cropping
 * - Input validation and progress reporting
 */

#include <gtest/gtest.h>
#include <rockseg/mesh/PoissonReconstructor.hpp>
#include <rockseg/mesh/ReconstructionPreprocessor.hpp>
#include <rockseg/core/exception.h>

#include <open3d/geometry/PointCloud.h>
#include <open3d/geometry/TriangleMesh.h>

#include <cmath>
#include <memory>
#include <vector>

using namespace rockseg;
using namespace rockseg::mesh;

namespace {

/**
 * @brief Synthetic sphere, Fibonacci lattice for uniform spacing
 */
std::shared_ptr<open3d::geometry::PointCloud> generateSphere(int numPoints, double radius) {
    auto cloud = std::make_shared<open3d::geometry::PointCloud>();
    const double phi = M_PI * (3.0 - std::sqrt(5.0));  // Golden angle

    for (int i = 0; i < numPoints; ++i) {
        double y = 1.0 - (i / double(numPoints - 1)) * 2.0;
        double r = std::sqrt(1.0 - y * y);
        double theta = phi * i;
        cloud->points_.push_back(Eigen::Vector3d(std::cos(theta) * r, y, std::sin(theta) * r) * radius);
    }
    return cloud;
}

} // namespace

class PoissonReconstructionTest : public ::testing::Test {
protected:
    void SetUp() override {
        sphere_ = generateSphere(5000, 1.0);
        poisson_.octreeDepth = 6;
    }

    std::shared_ptr<open3d::geometry::PointCloud> sphere_;
    PoissonSettings poisson_;
    ReconstructionPreprocessor preprocessor_;
    PoissonReconstructor reconstructor_;
};

TEST_F(PoissonReconstructionTest, SphereReconstruction) {
    ReconstructedMesh result = preprocessor_.run(*sphere_, reconstructor_, poisson_);

    ASSERT_TRUE(result.mesh);
    EXPECT_GT(result.vertexCount(), 100u);
    EXPECT_GT(result.triangleCount(), 100u);
    EXPECT_EQ(result.densities.size(), result.vertexCount());
    EXPECT_EQ(result.inputPoints, sphere_->points_.size());
    EXPECT_EQ(result.croppedVertices, 0u);

    // Vertices stay near the unit sphere
    double meanRadius = 0.0;
    for (const auto& v : result.mesh->vertices_) {
        meanRadius += v.norm();
    }
    meanRadius /= static_cast<double>(result.vertexCount());
    EXPECT_NEAR(meanRadius, 1.0, 0.1);

    EXPECT_TRUE(reconstructor_.getLastError().empty());
}

TEST_F(PoissonReconstructionTest, CroppingKeepsDensitiesAligned) {
    PoissonSettings cropped = poisson_;
    cropped.cropLowDensity = true;
    cropped.densityQuantile = 0.1;
    ReconstructedMesh result = preprocessor_.run(*sphere_, reconstructor_, cropped);

    ASSERT_TRUE(result.mesh);
    EXPECT_GT(result.croppedVertices, 0u);
    EXPECT_EQ(result.densities.size(), result.vertexCount());
}

TEST_F(PoissonReconstructionTest, ProgressReachesCompletion) {
    std::vector<int> progress;
    reconstructor_.setProgressCallback([&progress](int p) { progress.push_back(p); });

    preprocessor_.run(*sphere_, reconstructor_, poisson_);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), 100);
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GE(progress[i], progress[i - 1]);
    }
}

TEST_F(PoissonReconstructionTest, MissingNormalsRejected) {
    EXPECT_THROW(reconstructor_.reconstruct(*sphere_, poisson_), core::InvalidParameterException);
    EXPECT_FALSE(reconstructor_.getLastError().empty());
}

TEST_F(PoissonReconstructionTest, EmptyCloudRejected) {
    open3d::geometry::PointCloud empty;
    EXPECT_THROW(reconstructor_.reconstruct(empty, poisson_), core::EmptyInputException);
}

TEST_F(PoissonReconstructionTest, InvalidSettingsRejected) {
    auto withNormals = preprocessor_.estimateNormals(*sphere_);
    PoissonSettings invalid = poisson_;
    invalid.scale = 0.0;
    EXPECT_THROW(reconstructor_.reconstruct(*withNormals, invalid), core::InvalidParameterException);
}
