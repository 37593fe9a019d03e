#include "rockseg/pointcloud/SeedHeuristic.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"
#include "rockseg/pointcloud/SpatialIndex.hpp"

#include <open3d/geometry/PointCloud.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace rockseg {
namespace pointcloud {

std::string DefaultSeeds::toString() const {
    std::stringstream ss;
    ss << "rock seed=" << rockSeed << ", pedestal seed=" << pedestalSeed;
    return ss.str();
}

DefaultSeeds SeedHeuristic::compute(const open3d::geometry::PointCloud& cloud) {
    const auto& points = cloud.points_;
    if (points.empty()) {
        ROCKSEG_THROW(core::EmptyInputException, "Cannot compute seeds for an empty point cloud");
    }

    Eigen::Vector3d minBound = points.front();
    Eigen::Vector3d maxBound = points.front();
    for (const auto& p : points) {
        minBound = minBound.cwiseMin(p);
        maxBound = maxBound.cwiseMax(p);
    }
    const Eigen::Vector2d center(0.5 * (minBound.x() + maxBound.x()),
                                 0.5 * (minBound.y() + maxBound.y()));

    DefaultSeeds seeds;
    double bestScore = points.front().z() - (points.front().head<2>() - center).norm();
    double lowestZ = points.front().z();

    // Strict comparisons keep the first index on ties
    for (size_t i = 1; i < points.size(); ++i) {
        const auto& p = points[i];
        const double score = p.z() - (p.head<2>() - center).norm();
        if (score > bestScore) {
            bestScore = score;
            seeds.rockSeed = i;
        }
        if (p.z() < lowestZ) {
            lowestZ = p.z();
            seeds.pedestalSeed = i;
        }
    }

    LOG_INFO("[SeedHeuristic] Default seeds: " + seeds.toString());
    return seeds;
}

void SeedHeuristic::validate(const core::SeedSet& seeds, size_t cloudSize) {
    if (seeds.rock.empty()) {
        ROCKSEG_THROW(core::InvalidSeedException, "Rock seed set is empty");
    }
    if (seeds.pedestal.empty()) {
        ROCKSEG_THROW(core::InvalidSeedException, "Pedestal seed set is empty");
    }
    for (size_t index : seeds.rock) {
        if (index >= cloudSize) {
            ROCKSEG_THROW(core::InvalidSeedException,
                          "Rock seed index " + std::to_string(index) +
                          " out of range for cloud of " + std::to_string(cloudSize) + " points");
        }
    }
    for (size_t index : seeds.pedestal) {
        if (index >= cloudSize) {
            ROCKSEG_THROW(core::InvalidSeedException,
                          "Pedestal seed index " + std::to_string(index) +
                          " out of range for cloud of " + std::to_string(cloudSize) + " points");
        }
    }
}

std::vector<size_t> SeedHeuristic::parseIndexList(const std::string& text) {
    std::vector<size_t> indices;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        const auto first = token.find_first_not_of(" \t");
        const auto last = token.find_last_not_of(" \t");
        if (first == std::string::npos) {
            ROCKSEG_THROW(core::InvalidSeedException, "Empty entry in seed list \"" + text + "\"");
        }
        token = token.substr(first, last - first + 1);

        const bool digits = std::all_of(token.begin(), token.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
        if (!digits || token.size() > 18) {
            ROCKSEG_THROW(core::InvalidSeedException, "Not a point index: \"" + token + "\"");
        }
        indices.push_back(static_cast<size_t>(std::stoull(token)));
    }

    if (indices.empty()) {
        ROCKSEG_THROW(core::InvalidSeedException, "Seed list is empty");
    }
    return indices;
}

std::vector<size_t> SeedHeuristic::transfer(const open3d::geometry::PointCloud& source,
                                            const std::vector<size_t>& indices,
                                            const open3d::geometry::PointCloud& target) {
    for (size_t index : indices) {
        if (index >= source.points_.size()) {
            ROCKSEG_THROW(core::InvalidSeedException,
                          "Seed index " + std::to_string(index) +
                          " out of range for cloud of " + std::to_string(source.points_.size()) + " points");
        }
    }

    SpatialIndex index(target);
    std::vector<size_t> mapped;
    mapped.reserve(indices.size());
    for (size_t seed : indices) {
        int nearest = -1;
        double distance = 0.0;
        if (!index.queryNearest(source.points_[seed], nearest, distance)) {
            continue;
        }
        const size_t n = static_cast<size_t>(nearest);
        if (std::find(mapped.begin(), mapped.end(), n) == mapped.end()) {
            mapped.push_back(n);
        }
    }

    LOG_DEBUG("[SeedHeuristic] Transferred " + std::to_string(indices.size()) + " seeds to " +
              std::to_string(mapped.size()) + " points of the working cloud");
    return mapped;
}

} // namespace pointcloud
} // namespace rockseg
