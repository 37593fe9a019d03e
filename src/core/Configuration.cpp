#include "rockseg/core/Configuration.hpp"
#include "rockseg/core/Logger.hpp"

namespace rockseg {
namespace core {

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    try {
        YAML::Node loaded = YAML::LoadFile(filename);
        std::lock_guard<std::mutex> lock(mutex_);
        root_ = loaded;
        currentFile_ = filename;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("[Configuration] Failed to load " + filename + ": " + e.what());
        return false;
    }
    LOG_INFO("[Configuration] Loaded " + filename);
    return true;
}

bool Configuration::loadFromString(const std::string& yaml) {
    try {
        YAML::Node loaded = YAML::Load(yaml);
        std::lock_guard<std::mutex> lock(mutex_);
        root_ = loaded;
        currentFile_.clear();
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("[Configuration] Failed to parse YAML: ") + e.what());
        return false;
    }
    return true;
}

bool Configuration::reload() {
    std::string filename = getFilename();
    if (filename.empty()) {
        return false;
    }
    return load(filename);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    YAML::Node node;
    return lookup(key, node);
}

int Configuration::getInt(const std::string& key, int defaultValue) const {
    return get<int>(key, defaultValue);
}

double Configuration::getDouble(const std::string& key, double defaultValue) const {
    return get<double>(key, defaultValue);
}

bool Configuration::getBool(const std::string& key, bool defaultValue) const {
    return get<bool>(key, defaultValue);
}

std::string Configuration::getString(const std::string& key, const std::string& defaultValue) const {
    return get<std::string>(key, defaultValue);
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

bool Configuration::lookup(const std::string& key, YAML::Node& out) const {
    // reset() rebinds the handle; plain assignment would overwrite the parent node
    YAML::Node current;
    current.reset(root_);
    for (const auto& part : splitKey(key)) {
        if (!current.IsMap()) {
            return false;
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return false;
        }
        current.reset(child);
    }
    out.reset(current);
    return true;
}

std::vector<std::string> Configuration::splitKey(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= key.size()) {
        size_t dot = key.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(key.substr(start));
            break;
        }
        parts.push_back(key.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

} // namespace core
} // namespace rockseg
