#include <handcal/core/Configuration.hpp>
#include <handcal/core/Logger.hpp>
#include <handcal/core/exception.hpp>
#include <sstream>
#include <vector>

namespace handcal {
namespace core {

namespace {

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Walks nested maps through const operator[] so the document is never modified
YAML::Node descend(const YAML::Node& node, const std::vector<std::string>& parts, size_t depth) {
    if (depth == parts.size()) {
        return node;
    }
    if (!node.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    const YAML::Node child = node[parts[depth]];
    if (!child.IsDefined()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return descend(child, parts, depth + 1);
}

gesture::PointOfInterest parsePointOfInterest(const std::string& name) {
    if (name == "index_tip") {
        return gesture::PointOfInterest::INDEX_TIP;
    }
    if (name == "palm_center") {
        return gesture::PointOfInterest::PALM_CENTER;
    }
    HANDCAL_THROW(ConfigurationException, "Unknown point_of_interest: " + name);
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    YAML::Node document;
    try {
        document = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        HANDCAL_LOG_ERROR("Configuration") << "Failed to load " << filename << ": " << e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = document;
    currentFile_ = filename;
    HANDCAL_LOG_INFO("Configuration") << "Loaded " << filename;
    return true;
}

bool Configuration::loadFromString(const std::string& yaml) {
    YAML::Node document;
    try {
        document = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        HANDCAL_LOG_ERROR("Configuration") << "Failed to parse configuration: " << e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = document;
    currentFile_.clear();
    return true;
}

bool Configuration::reload() {
    std::string filename = getFilename();
    if (filename.empty()) {
        HANDCAL_LOG_WARNING("Configuration") << "reload() without a loaded file";
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
    YAML::Node node = lookup(key);
    return node.IsDefined() && !node.IsNull();
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

YAML::Node Configuration::lookup(const std::string& key) const {
    std::vector<std::string> parts = splitKey(key);
    if (parts.empty()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return descend(root_, parts, 0);
}

gesture::TrackingConfig Configuration::getTrackingConfig() const {
    gesture::TrackingConfig config;

    config.buffer_capacity = get<std::size_t>("tracking.buffer_capacity", config.buffer_capacity);
    config.min_weight = get<double>("tracking.min_weight", config.min_weight);
    config.max_weight = get<double>("tracking.max_weight", config.max_weight);
    config.landmark_stability_threshold =
        get<double>("tracking.landmark_stability_threshold", config.landmark_stability_threshold);
    config.position_stability_threshold =
        get<double>("tracking.position_stability_threshold", config.position_stability_threshold);
    config.stability_window = get<std::size_t>("tracking.stability_window", config.stability_window);
    config.stability_score_cap = get<int>("tracking.stability_score_cap", config.stability_score_cap);

    if (has("tracking.point_of_interest")) {
        config.point_of_interest =
            parsePointOfInterest(get<std::string>("tracking.point_of_interest"));
    }

    if (!config.is_valid()) {
        HANDCAL_THROW(ConfigurationException, "Invalid tracking section");
    }
    return config;
}

gesture::CalibrationConfig Configuration::getCalibrationConfig() const {
    gesture::CalibrationConfig config;

    config.finger_threshold_ratio =
        get<double>("calibration.finger_threshold_ratio", config.finger_threshold_ratio);
    config.pinch_threshold_ratio =
        get<double>("calibration.pinch_threshold_ratio", config.pinch_threshold_ratio);

    if (!config.is_valid()) {
        HANDCAL_THROW(ConfigurationException, "Invalid calibration section");
    }
    return config;
}

} // namespace core
} // namespace handcal
