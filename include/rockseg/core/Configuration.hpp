#pragma once

#include <yaml-cpp/yaml.h>

#include <mutex>
#include <string>
#include <vector>

namespace rockseg {
namespace core {

/**
 * Configuration management class
 *
 * Holds one YAML document and gives typed access to its values through
 * dot-separated keys ("basal.k", "reconstruction.octree_depth").
 * Missing keys and type mismatches fall back to the supplied default.
 */
class Configuration {
public:
    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    Configuration() = default;
    ~Configuration() = default;

    /**
     * Load configuration from a YAML file
     * @return false if the file is missing or malformed (contents unchanged)
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from a YAML string
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Reload the file passed to the last successful load()
     */
    bool reload();

    void clear();

    bool has(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node;
        if (!lookup(key, node) || !node.IsScalar()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return defaultValue;
        }
    }

    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    bool getBool(const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    std::string getFilename() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    bool lookup(const std::string& key, YAML::Node& out) const;
    static std::vector<std::string> splitKey(const std::string& key);

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace rockseg
