#include "pursuit/core/config.hpp"
#include "pursuit/core/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace pursuit {

// ============================================================================
// Implementation details
// ============================================================================

struct Config::Impl {
    YAML::Node root;

    YAML::Node navigate(const std::string& key) const {
        std::vector<std::string> parts;
        std::stringstream ss(key);
        std::string part;
        while (std::getline(ss, part, '.')) {
            parts.push_back(part);
        }

        // operator[] on a non-const node inserts missing keys; walk a clone
        YAML::Node current = YAML::Clone(root);

        for (const auto& p : parts) {
            if (!current || !current.IsMap()) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            if (!current[p]) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            current = current[p];
        }

        return current;
    }

    template<typename T>
    bool scalar(const std::string& key, T& out) const {
        try {
            auto node = navigate(key);
            if (node && node.IsScalar()) {
                out = node.as<T>();
                return true;
            }
        } catch (const YAML::Exception& e) {
            LOG_WARN("Config key '{}' has wrong type: {}", key, e.what());
        }
        return false;
    }
};

Config::Config() = default;
Config::~Config() = default;

// ============================================================================
// Loading
// ============================================================================

bool Config::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto impl = std::make_unique<Impl>();
        impl->root = YAML::LoadFile(path);
        impl_ = std::move(impl);
        file_path_ = path;

        LOG_INFO("Loaded configuration from: {}", path);
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to load config from {}: {}", path, e.what());
        return false;
    }
}

bool Config::load_string(const std::string& yaml) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        auto impl = std::make_unique<Impl>();
        impl->root = YAML::Load(yaml);
        impl_ = std::move(impl);
        file_path_.clear();
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to parse config document: {}", e.what());
        return false;
    }
}

// ============================================================================
// Typed access
// ============================================================================

bool Config::find_override(const std::string& key, std::string& value) const {
    auto it = overrides_.find(key);
    if (it == overrides_.end()) {
        return false;
    }
    value = it->second;
    return true;
}

std::string Config::get_string(const std::string& key,
                               const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string value;
    if (find_override(key, value)) {
        return value;
    }

    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string text;
    if (find_override(key, text)) {
        try {
            return std::stoi(text);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring non-integer override {}={}", key, text);
        }
    }

    int value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

float Config::get_float(const std::string& key, float default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string text;
    if (find_override(key, text)) {
        try {
            return std::stof(text);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring non-numeric override {}={}", key, text);
        }
    }

    float value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string text;
    if (find_override(key, text)) {
        try {
            return std::stod(text);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring non-numeric override {}={}", key, text);
        }
    }

    double value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string text;
    if (find_override(key, text)) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text == "true" || text == "1" || text == "yes" || text == "on";
    }

    bool value = default_value;
    if (impl_ && impl_->scalar(key, value)) {
        return value;
    }
    return default_value;
}

std::vector<float> Config::get_float_list(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<float> result;
    if (!impl_) return result;

    try {
        auto node = impl_->navigate(key);
        if (node && node.IsSequence()) {
            for (const auto& item : node) {
                result.push_back(item.as<float>());
            }
        }
    } catch (const YAML::Exception& e) {
        LOG_WARN("Config list '{}' is not numeric: {}", key, e.what());
        result.clear();
    }

    return result;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (overrides_.find(key) != overrides_.end()) {
        return true;
    }
    if (!impl_) return false;

    auto node = impl_->navigate(key);
    return node && node.IsDefined();
}

// ============================================================================
// Overrides
// ============================================================================

void Config::override(const std::string& key, const std::string& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        overrides_[key] = value;
    }
    // Callbacks run unlocked so they can read the new value back
    notify_change(key);
}

void Config::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) != "--") {
            continue;
        }

        arg = arg.substr(2);
        auto eq_pos = arg.find('=');

        std::string key, value;

        if (eq_pos != std::string::npos) {
            key = arg.substr(0, eq_pos);
            value = arg.substr(eq_pos + 1);
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            key = arg;
            value = argv[++i];
        } else {
            key = arg;
            value = "true";
        }

        std::replace(key.begin(), key.end(), '-', '.');

        override(key, value);
        LOG_DEBUG("Config override: {} = {}", key, value);
    }
}

void Config::on_change(const std::string& key, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_[key].push_back(std::move(callback));
}

void Config::notify_change(const std::string& key) {
    std::vector<ChangeCallback> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = callbacks_.find(key);
        if (it != callbacks_.end()) {
            to_call.insert(to_call.end(), it->second.begin(), it->second.end());
        }
        it = callbacks_.find("*");
        if (it != callbacks_.end()) {
            to_call.insert(to_call.end(), it->second.begin(), it->second.end());
        }
    }

    for (const auto& cb : to_call) {
        cb(key);
    }
}

// ============================================================================
// Global Configuration
// ============================================================================
Config& global_config() {
    static Config instance;
    return instance;
}

}  // namespace pursuit
