#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pursuit {

/**
 * @brief Configuration management class
 *
 * Provides hierarchical configuration access with:
 * - YAML file loading
 * - Type-safe value retrieval with defaults
 * - Command-line override support
 * - Change notification for runtime tuning
 */
class Config {
public:
    Config();
    ~Config();

    // Non-copyable, non-movable (owns a mutex and callbacks bound to it)
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from YAML file
     *
     * @param path Path to YAML file
     * @return true if loaded successfully
     */
    bool load(const std::string& path);

    /**
     * @brief Load configuration from an in-memory YAML document
     */
    bool load_string(const std::string& yaml);

    /**
     * @brief Get string value
     *
     * @param key Dot-separated key path (e.g., "controller.kp")
     * @param default_value Value to return if key not found
     * @return Configuration value or default
     */
    std::string get_string(const std::string& key,
                           const std::string& default_value = "") const;

    int get_int(const std::string& key, int default_value = 0) const;

    float get_float(const std::string& key, float default_value = 0.0f) const;

    double get_double(const std::string& key, double default_value = 0.0) const;

    bool get_bool(const std::string& key, bool default_value = false) const;

    /**
     * @brief Get vector of floats
     */
    std::vector<float> get_float_list(const std::string& key) const;

    /**
     * @brief Check if key exists (file or override)
     */
    bool has(const std::string& key) const;

    /**
     * @brief Override value (runtime updates or command-line)
     *
     * Overrides take precedence over file values. Registered callbacks for
     * the key and for "*" are invoked after the value is stored.
     */
    void override(const std::string& key, const std::string& value);

    /**
     * @brief Parse command-line arguments
     *
     * Supports --key=value, --key value and bare --flag (= "true").
     * Dashes in keys become dots.
     */
    void parse_args(int argc, char* argv[]);

    /**
     * @brief Register callback for configuration changes
     *
     * @param key Key to watch (or "*" for all changes)
     */
    using ChangeCallback = std::function<void(const std::string& key)>;
    void on_change(const std::string& key, ChangeCallback callback);

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    mutable std::mutex mutex_;

    std::unordered_map<std::string, std::vector<ChangeCallback>> callbacks_;

    // Command-line / runtime overrides (take precedence)
    std::unordered_map<std::string, std::string> overrides_;

    bool find_override(const std::string& key, std::string& value) const;
    void notify_change(const std::string& key);
};

/**
 * @brief Global configuration instance
 */
Config& global_config();

}  // namespace pursuit
