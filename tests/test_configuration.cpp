/**
 * @file test_configuration.cpp
 * @brief YAML configuration and pipeline parameter tests
 *
 * Validates:
 * - Dot-separated key lookup in nested maps
 * - Defaults for missing keys and type mismatches
 * - PipelineParameters::fromConfiguration
 */

#include <gtest/gtest.h>
#include <rockseg/core/Configuration.hpp>
#include <rockseg/api/PipelineParameters.hpp>

#include <filesystem>
#include <fstream>

using namespace rockseg;

namespace {

const char* kPipelineYaml = R"(
preprocessing:
  downsample: false
  voxel_size: 0.02
  normal_radius: 0.2
segmentation:
  smoothness: 0.9
basal:
  k: 20
  tau: 0.3
boundary_fill:
  interpolation_count: 15
  max_workers: 2
reconstruction:
  octree_depth: 9
  crop_low_density: true
)";

} // namespace

TEST(ConfigurationTest, NestedKeyLookup) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString(kPipelineYaml));

    EXPECT_TRUE(config.has("basal.k"));
    EXPECT_TRUE(config.has("basal"));
    EXPECT_FALSE(config.has("basal.missing"));
    EXPECT_FALSE(config.has("basal.k.deeper"));

    EXPECT_EQ(config.getInt("basal.k"), 20);
    EXPECT_DOUBLE_EQ(config.getDouble("basal.tau"), 0.3);
    EXPECT_FALSE(config.getBool("preprocessing.downsample", true));
    EXPECT_EQ(config.getString("reconstruction.octree_depth"), "9");
}

TEST(ConfigurationTest, RepeatedLookupsLeaveDocumentIntact) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString(kPipelineYaml));
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(config.getInt("boundary_fill.interpolation_count"), 15);
        EXPECT_EQ(config.getInt("boundary_fill.max_workers"), 2);
        EXPECT_EQ(config.getInt("reconstruction.octree_depth"), 9);
    }
}

TEST(ConfigurationTest, DefaultsForMissingOrMistypedKeys) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString("basal:\n  k: many\n"));

    EXPECT_EQ(config.getInt("basal.k", 30), 30);
    EXPECT_DOUBLE_EQ(config.getDouble("basal.tau", 0.35), 0.35);
    EXPECT_EQ(config.getInt("basal", 7), 7);
    EXPECT_EQ(config.getString("nothing.here", "fallback"), "fallback");

    config.clear();
    EXPECT_FALSE(config.has("basal.k"));
}

TEST(ConfigurationTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "rockseg_test_config.yaml";
    {
        std::ofstream out(path);
        out << kPipelineYaml;
    }

    core::Configuration config;
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.getFilename(), path.string());
    EXPECT_EQ(config.getInt("basal.k"), 20);
    EXPECT_TRUE(config.reload());

    std::filesystem::remove(path);
    EXPECT_FALSE(config.load(path.string()));
    // Previous contents survive a failed load
    EXPECT_EQ(config.getInt("basal.k"), 20);
}

TEST(ConfigurationTest, MalformedYamlRejected) {
    core::Configuration config;
    EXPECT_FALSE(config.loadFromString("basal: [unclosed"));
}

TEST(PipelineParametersTest, ReadFromConfiguration) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString(kPipelineYaml));

    api::PipelineParameters params = api::PipelineParameters::fromConfiguration(config);
    EXPECT_FALSE(params.downsample);
    EXPECT_DOUBLE_EQ(params.voxelSize, 0.02);
    EXPECT_DOUBLE_EQ(params.preprocess.normalRadius, 0.2);
    EXPECT_DOUBLE_EQ(params.thresholds.smoothness, 0.9);
    EXPECT_EQ(params.basal.neighbors, 20);
    EXPECT_DOUBLE_EQ(params.basal.mixtureThreshold, 0.3);
    EXPECT_EQ(params.boundaryFill.interpolationCount, 15);
    EXPECT_EQ(params.boundaryFill.maxWorkers, 2);
    EXPECT_EQ(params.poisson.octreeDepth, 9);
    EXPECT_TRUE(params.poisson.cropLowDensity);

    // Untouched keys keep their defaults
    EXPECT_DOUBLE_EQ(params.thresholds.curvature, 0.15);
    EXPECT_EQ(params.preprocess.maxNeighbors, 30);
    EXPECT_EQ(params.boundaryFill.raySamples, 100);
    EXPECT_DOUBLE_EQ(params.poisson.scale, 1.1);
    EXPECT_TRUE(params.validate());
}

TEST(PipelineParametersTest, EmptyConfigurationGivesDefaults) {
    core::Configuration config;
    api::PipelineParameters params = api::PipelineParameters::fromConfiguration(config);
    EXPECT_TRUE(params.downsample);
    EXPECT_DOUBLE_EQ(params.voxelSize, 0.01);
    EXPECT_EQ(params.basal.neighbors, 30);
    EXPECT_DOUBLE_EQ(params.basal.mixtureThreshold, 0.35);
    EXPECT_EQ(params.poisson.octreeDepth, 8);
    EXPECT_TRUE(params.validate());
}

TEST(PipelineParametersTest, OutOfRangeValuesFailValidation) {
    core::Configuration config;
    ASSERT_TRUE(config.loadFromString("basal:\n  tau: 0.7\n"));
    api::PipelineParameters params = api::PipelineParameters::fromConfiguration(config);
    EXPECT_FALSE(params.validate());
    EXPECT_NE(params.toString().find("0.7"), std::string::npos);
}
