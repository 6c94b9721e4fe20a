#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace kickqr {

/**
 * @brief Raw configuration source
 *
 * Provides hierarchical configuration access with:
 * - YAML file loading
 * - Type-safe value retrieval with defaults
 * - Command-line override support
 *
 * Pipeline stages never read this directly; GeneratorConfig::from_config
 * turns it into a typed, validated record.
 */
class Config {
public:
    Config();
    ~Config();

    // Non-copyable, moveable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    /**
     * @brief Load configuration from YAML file
     *
     * @param path Path to YAML file
     * @return true if loaded successfully
     */
    bool load(const std::string& path);

    /**
     * @brief Get string value
     *
     * @param key Dot-separated key path (e.g., "qr.data")
     * @param default_value Value to return if key not found
     * @return Configuration value or default
     */
    std::string get_string(const std::string& key,
                           const std::string& default_value = "") const;

    /**
     * @brief Get integer value
     */
    int get_int(const std::string& key, int default_value = 0) const;

    /**
     * @brief Get double value
     */
    double get_double(const std::string& key, double default_value = 0.0) const;

    /**
     * @brief Get boolean value
     */
    bool get_bool(const std::string& key, bool default_value = false) const;

    /**
     * @brief Get vector of integers
     *
     * Overrides are accepted as comma-separated lists ("200,16,46").
     */
    std::vector<int> get_int_list(const std::string& key) const;

    /**
     * @brief Check if key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Override value from command line
     *
     * Command-line overrides take precedence over file values.
     *
     * @param key Key path
     * @param value Value string (will be parsed)
     */
    void override(const std::string& key, const std::string& value);

    /**
     * @brief Parse command-line arguments
     *
     * Supports --key=value and --key value formats. A flag without a
     * value is stored as "true".
     *
     * @param argc Argument count
     * @param argv Argument values
     */
    void parse_args(int argc, char* argv[]);

    /**
     * @brief Get the configuration file path
     */
    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;

    // Internal storage
    struct Impl;
    std::unique_ptr<Impl> impl_;

    // Command-line overrides (take precedence)
    std::unordered_map<std::string, std::string> overrides_;
};

}  // namespace kickqr
