#pragma once

#include "detector_options.hpp"
#include "../replacement/replacement_table.hpp"
#include "../../common/logging.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wordguard {

// Complete detector configuration as stored in a config file
struct DetectorConfig {
    DetectorOptions options;

    // Caller-supplied replacement table; when unset the table is derived
    // from the folding flags
    bool use_custom_replacements = false;
    ReplacementTable custom_replacements;

    common::LogConfig logging;
};

class ConfigManager {
public:
    // Constructor and destructor
    ConfigManager();
    ~ConfigManager() = default;

    // Load/save configurations
    void load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
    void load_from_string(const std::string& content);
    std::string save_to_string() const;

    // Access configurations
    const DetectorConfig& get_config() const { return config_; }
    const DetectorOptions& get_options() const { return config_.options; }
    const common::LogConfig& get_log_config() const { return config_.logging; }

    // Update configurations
    void update_options(const DetectorOptions& options);
    void update_log_config(const common::LogConfig& config);
    void set_custom_replacements(const ReplacementTable& table);
    void clear_custom_replacements();

    // Runtime parameter updates
    void update_param(const std::string& param, const std::string& value);

    // Apply the logging section to the process-wide logger
    void apply_logging() const;

    // Reset configurations
    void reset_to_defaults();

    // Validation
    bool validate_configurations() const;
    std::string get_validation_errors() const;

private:
    DetectorConfig config_;

    // Validation state
    mutable std::vector<std::string> validation_errors_;

    // Internal helper methods
    void load_json_config(const nlohmann::json& json);
    nlohmann::json save_json_config() const;
    bool validate_options() const;
    bool validate_logging() const;

    // Parameter conversion helpers
    static bool parse_bool(const std::string& param, const std::string& value);
    static char32_t parse_character(const std::string& value);
};

} // namespace wordguard
