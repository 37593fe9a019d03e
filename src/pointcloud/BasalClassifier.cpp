#include "rockseg/pointcloud/BasalClassifier.hpp"
#include "rockseg/pointcloud/SpatialIndex.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"

#include <open3d/geometry/PointCloud.h>

#include <chrono>
#include <sstream>

namespace rockseg {
namespace pointcloud {

bool BasalSettings::validate() const {
    if (neighbors < 1) return false;
    if (mixtureThreshold < 0.0 || mixtureThreshold > 0.5) return false;
    return true;
}

std::string BasalSettings::toString() const {
    std::stringstream ss;
    ss << "Basal Classification Settings:\n";
    ss << "  Neighbors (k): " << neighbors << "\n";
    ss << "  Mixture threshold (tau): " << mixtureThreshold;
    return ss.str();
}

BasalClassifier::BasalClassifier(const BasalSettings& settings)
    : settings_(settings) {}

core::BasalMask BasalClassifier::classify(const open3d::geometry::PointCloud& cloud,
                                          const core::LabelArray& labels) const {
    if (!settings_.validate()) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Invalid basal settings (k >= 1, tau in [0, 0.5]): k=" +
                      std::to_string(settings_.neighbors) +
                      ", tau=" + std::to_string(settings_.mixtureThreshold));
    }

    const size_t numPoints = cloud.points_.size();
    if (numPoints == 0) {
        ROCKSEG_THROW(core::EmptyInputException, "Cannot classify basal points of an empty cloud");
    }
    if (labels.size() != numPoints) {
        ROCKSEG_THROW(core::InvalidParameterException,
                      "Label count " + std::to_string(labels.size()) +
                      " does not match point count " + std::to_string(numPoints));
    }

    core::BasalMask result;
    result.generation = labels.generation;
    result.mask.assign(numPoints, false);

    const double tau = settings_.mixtureThreshold;
    if (tau >= 0.5) {
        LOG_DEBUG("[BasalClassifier] tau = 0.5 selects an empty band, no basal points");
        return result;
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    SpatialIndex index(cloud);
    const int k = settings_.neighbors;
    const double lower = tau;
    const double upper = 1.0 - tau;

    for (size_t i = 0; i < numPoints; ++i) {
        KnnResult neighbors = index.queryKNN(cloud.points_[i], k);
        size_t rockCount = 0;
        for (int idx : neighbors.indices) {
            if (labels.labels[static_cast<size_t>(idx)] == core::Label::ROCK) {
                ++rockCount;
            }
        }
        const double rockRatio = static_cast<double>(rockCount) / static_cast<double>(k);
        result.mask[i] = (lower <= rockRatio) && (rockRatio <= upper);
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

    ROCKSEG_LOG_INFO("BasalClassifier") << "Detected " << result.count() << " basal points out of "
                                        << numPoints << " (k=" << k << ", tau=" << tau << ", "
                                        << duration.count() << " ms)";
    return result;
}

} // namespace pointcloud
} // namespace rockseg
