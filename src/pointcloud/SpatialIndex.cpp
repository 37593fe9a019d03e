#include "rockseg/pointcloud/SpatialIndex.hpp"
#include "rockseg/core/exception.h"
#include "rockseg/core/Logger.hpp"

#include <open3d/geometry/KDTreeFlann.h>
#include <open3d/geometry/PointCloud.h>

#include <algorithm>
#include <cmath>

namespace rockseg {
namespace pointcloud {

SpatialIndex::SpatialIndex(const std::vector<Eigen::Vector3d>& points)
    : points_(points) {
    build();
}

SpatialIndex::SpatialIndex(const open3d::geometry::PointCloud& cloud)
    : points_(cloud.points_) {
    build();
}

SpatialIndex::~SpatialIndex() = default;

void SpatialIndex::build() {
    if (points_.empty()) {
        ROCKSEG_THROW(core::EmptyInputException, "Cannot build spatial index on an empty point set");
    }

    Eigen::MatrixXd data(3, static_cast<Eigen::Index>(points_.size()));
    for (size_t i = 0; i < points_.size(); ++i) {
        data.col(static_cast<Eigen::Index>(i)) = points_[i];
    }

    tree_ = std::make_unique<open3d::geometry::KDTreeFlann>(data);

    LOG_TRACE("[SpatialIndex] Built KD-tree over " + std::to_string(points_.size()) + " points");
}

KnnResult SpatialIndex::queryKNN(const Eigen::Vector3d& query, int k) const {
    KnnResult result;
    if (k <= 0) {
        return result;
    }

    const int knn = static_cast<int>(std::min<size_t>(static_cast<size_t>(k), points_.size()));
    std::vector<double> distance2;
    const int found = tree_->SearchKNN(query, knn, result.indices, distance2);
    if (found <= 0) {
        result.indices.clear();
        return result;
    }

    result.indices.resize(static_cast<size_t>(found));
    distance2.resize(static_cast<size_t>(found));
    result.distances.reserve(distance2.size());
    for (double d2 : distance2) {
        result.distances.push_back(std::sqrt(std::max(0.0, d2)));
    }
    return result;
}

std::vector<KnnResult> SpatialIndex::queryKNNBatch(const std::vector<Eigen::Vector3d>& queries, int k) const {
    std::vector<KnnResult> results;
    results.reserve(queries.size());
    for (const auto& query : queries) {
        results.push_back(queryKNN(query, k));
    }
    return results;
}

bool SpatialIndex::queryNearest(const Eigen::Vector3d& query, int& index, double& distance) const {
    KnnResult result = queryKNN(query, 1);
    if (result.empty()) {
        return false;
    }
    index = result.indices.front();
    distance = result.distances.front();
    return true;
}

} // namespace pointcloud
} // namespace rockseg
