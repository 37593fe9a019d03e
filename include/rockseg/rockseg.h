#pragma once

/**
 * @file rockseg.h
 * @brief Main header for the rockseg library
 *
 * Include this single header to access the complete rock / pedestal
 * segmentation and reconstruction pipeline.
 */

#define ROCKSEG_VERSION_MAJOR 1
#define ROCKSEG_VERSION_MINOR 0
#define ROCKSEG_VERSION_PATCH 0

// Core types and utilities
#include "rockseg/core/types.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"
#include "rockseg/core/Configuration.hpp"

// Point cloud processing
#include "rockseg/pointcloud/SpatialIndex.hpp"
#include "rockseg/pointcloud/SeedHeuristic.hpp"
#include "rockseg/pointcloud/BasalClassifier.hpp"
#include "rockseg/pointcloud/BoundaryFiller.hpp"

// Segmentation collaborators
#include "rockseg/segmentation/Segmenter.hpp"
#include "rockseg/segmentation/PrelabeledSegmenter.hpp"

// Surface reconstruction
#include "rockseg/mesh/SurfaceReconstructor.hpp"
#include "rockseg/mesh/PoissonReconstructor.hpp"
#include "rockseg/mesh/ReconstructionPreprocessor.hpp"

// Persistence
#include "rockseg/io/LasIO.hpp"
#include "rockseg/io/MeshIO.hpp"

// Pipeline
#include "rockseg/api/PipelineParameters.hpp"
#include "rockseg/api/RockPipeline.hpp"

#include <string>

namespace rockseg {

/**
 * @brief Version string (e.g., "1.0.0")
 */
inline std::string getVersionString() {
    return std::to_string(ROCKSEG_VERSION_MAJOR) + "." +
           std::to_string(ROCKSEG_VERSION_MINOR) + "." +
           std::to_string(ROCKSEG_VERSION_PATCH);
}

} // namespace rockseg
