#include "rockseg/core/types.hpp"

#include <open3d/geometry/PointCloud.h>

#include <algorithm>

namespace rockseg {
namespace core {

size_t CloudHandle::size() const {
    return cloud ? cloud->points_.size() : 0;
}

size_t LabelArray::count(Label label) const {
    return static_cast<size_t>(std::count(labels.begin(), labels.end(), label));
}

size_t BasalMask::count() const {
    return static_cast<size_t>(std::count(mask.begin(), mask.end(), true));
}

std::vector<size_t> BasalMask::indices() const {
    std::vector<size_t> result;
    for (size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) {
            result.push_back(i);
        }
    }
    return result;
}

std::string labelToString(Label label) {
    switch (label) {
        case Label::UNLABELED: return "UNLABELED";
        case Label::PEDESTAL:  return "PEDESTAL";
        case Label::ROCK:      return "ROCK";
        default:               return "UNKNOWN";
    }
}

} // namespace core
} // namespace rockseg
