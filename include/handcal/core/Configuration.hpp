#pragma once

#include <string>
#include <mutex>
#include <yaml-cpp/yaml.h>
#include <handcal/gesture/GestureTypes.hpp>

namespace handcal {
namespace core {

/**
 * Configuration management class
 *
 * Holds one YAML document. Keys are dotted paths into nested maps,
 * e.g. "tracking.buffer_capacity".
 *
 * Example file:
 *
 *   tracking:
 *     buffer_capacity: 5
 *     point_of_interest: index_tip
 *   calibration:
 *     finger_threshold_ratio: 0.12
 */
class Configuration {
public:
    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    /**
     * Load configuration from file
     *
     * On failure the previous document is kept and false is returned.
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from a YAML string
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Reload the last file passed to load()
     */
    bool reload();

    /**
     * Clear all configuration
     */
    void clear();

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const;

    /**
     * Get value, or defaultValue if the key is missing or not convertible
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = lookup(key);
        if (!node.IsDefined() || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return defaultValue;
        }
    }

    /**
     * Build tracking configuration from the "tracking" section
     *
     * Missing keys keep their defaults.
     * @throws ConfigurationException if the result is invalid
     */
    gesture::TrackingConfig getTrackingConfig() const;

    /**
     * Build calibration configuration from the "calibration" section
     *
     * @throws ConfigurationException if the result is invalid
     */
    gesture::CalibrationConfig getCalibrationConfig() const;

    /**
     * Get configuration filename
     */
    std::string getFilename() const;

private:
    Configuration() = default;
    ~Configuration() = default;

    // Delete copy/move
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    YAML::Node lookup(const std::string& key) const;

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace handcal
