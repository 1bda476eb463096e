#include "config_manager.hpp"
#include "../../common/error.hpp"
#include "../../common/utils.hpp"
#include <fstream>
#include <sstream>

namespace wordguard {

ConfigManager::ConfigManager() {
    reset_to_defaults();
}

void ConfigManager::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common::IOException("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    load_from_string(buffer.str());
    LOG_INFO("Loaded configuration from " + path);
}

void ConfigManager::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw common::IOException("Failed to create config file: " + path);
    }

    file << save_to_string();
    if (!file) {
        throw common::IOException("Failed to write config file: " + path);
    }
}

void ConfigManager::load_from_string(const std::string& content) {
    DetectorConfig previous = config_;
    try {
        nlohmann::json json = nlohmann::json::parse(content);
        if (!json.is_object()) {
            throw common::ConfigException("Configuration root must be a JSON object");
        }
        load_json_config(json);
    } catch (const nlohmann::json::exception& e) {
        config_ = previous;
        throw common::ConfigException("JSON parsing error: " + std::string(e.what()));
    } catch (const common::Exception&) {
        config_ = previous;
        throw;
    }

    if (!validate_configurations()) {
        config_ = previous;
        throw common::ConfigException("Invalid configuration: " + get_validation_errors());
    }
}

std::string ConfigManager::save_to_string() const {
    return save_json_config().dump(4);  // Pretty print with 4-space indent
}

void ConfigManager::update_options(const DetectorOptions& options) {
    options.validate();
    config_.options = options;
}

void ConfigManager::update_log_config(const common::LogConfig& config) {
    common::LogConfig previous = config_.logging;
    config_.logging = config;
    validation_errors_.clear();
    if (!validate_logging()) {
        config_.logging = previous;
        throw common::ConfigException("Invalid logging configuration: " + get_validation_errors());
    }
}

void ConfigManager::set_custom_replacements(const ReplacementTable& table) {
    config_.use_custom_replacements = true;
    config_.custom_replacements = table;
}

void ConfigManager::clear_custom_replacements() {
    config_.use_custom_replacements = false;
    config_.custom_replacements = ReplacementTable();
}

void ConfigManager::update_param(const std::string& param, const std::string& value) {
    DetectorOptions& options = config_.options;
    common::LogConfig& logging = config_.logging;

    if (param == "sanitize_special_characters") {
        options.sanitize_special_characters = parse_bool(param, value);
    } else if (param == "sanitize_leet_speak") {
        options.sanitize_leet_speak = parse_bool(param, value);
    } else if (param == "sanitize_accents") {
        options.sanitize_accents = parse_bool(param, value);
    } else if (param == "sanitize_spaces") {
        options.sanitize_spaces = parse_bool(param, value);
        if (options.sanitize_spaces) {
            options.exact_word = false;
        }
    } else if (param == "exact_word") {
        options.exact_word = parse_bool(param, value);
        if (options.exact_word) {
            options.sanitize_spaces = false;
        }
    } else if (param == "log_level") {
        logging.level = common::parse_log_level(common::StringUtils::trim(value));
    } else if (param == "console_output") {
        logging.console_output = parse_bool(param, value);
    } else if (param == "file_output") {
        logging.file_output = parse_bool(param, value);
    } else if (param == "log_dir") {
        logging.log_dir = value;
    } else if (param == "log_file") {
        logging.log_file = value;
    } else {
        throw common::ConfigException("Unknown parameter: " + param);
    }

    LOG_DEBUG("Updated parameter " + param + " = " + value);
}

void ConfigManager::apply_logging() const {
    common::Logger::instance().initialize(config_.logging);
}

void ConfigManager::reset_to_defaults() {
    config_ = DetectorConfig();
    validation_errors_.clear();
}

bool ConfigManager::validate_configurations() const {
    validation_errors_.clear();
    bool options_valid = validate_options();
    bool logging_valid = validate_logging();
    return options_valid && logging_valid;
}

std::string ConfigManager::get_validation_errors() const {
    std::stringstream ss;
    for (size_t i = 0; i < validation_errors_.size(); i++) {
        if (i > 0) {
            ss << "; ";
        }
        ss << validation_errors_[i];
    }
    return ss.str();
}

void ConfigManager::load_json_config(const nlohmann::json& json) {
    DetectorOptions& options = config_.options;

    if (json.contains("sanitizer")) {
        const auto& sanitizer = json.at("sanitizer");
        options.sanitize_special_characters = sanitizer.value("special_characters", true);
        options.sanitize_leet_speak = sanitizer.value("leet_speak", true);
        options.sanitize_accents = sanitizer.value("accents", true);
        options.sanitize_spaces = sanitizer.value("spaces", true);
    }

    if (json.contains("matcher")) {
        const auto& matcher = json.at("matcher");
        options.exact_word = matcher.value("exact_word", false);
    }

    if (json.contains("character_replacements")) {
        const auto& replacements = json.at("character_replacements");
        if (!replacements.is_object()) {
            throw common::ConfigException("character_replacements must be a JSON object");
        }
        ReplacementTable table;
        for (auto it = replacements.begin(); it != replacements.end(); ++it) {
            table.set(parse_character(it.key()), parse_character(it.value().get<std::string>()));
        }
        config_.use_custom_replacements = true;
        config_.custom_replacements = table;
    }

    if (json.contains("logging")) {
        const auto& log = json.at("logging");
        common::LogConfig& logging = config_.logging;
        logging.level = common::parse_log_level(log.value("level", std::string("WARNING")));
        logging.console_output = log.value("console_output", true);
        logging.file_output = log.value("file_output", false);
        logging.log_dir = log.value("log_dir", std::string("./logs"));
        logging.log_file = log.value("log_file", std::string("wordguard.log"));
        logging.max_file_size = log.value("max_file_size", logging.max_file_size);
        logging.max_files = log.value("max_files", logging.max_files);
    }
}

nlohmann::json ConfigManager::save_json_config() const {
    nlohmann::json json;
    const DetectorOptions& options = config_.options;

    json["sanitizer"] = {
        {"special_characters", options.sanitize_special_characters},
        {"leet_speak", options.sanitize_leet_speak},
        {"accents", options.sanitize_accents},
        {"spaces", options.sanitize_spaces}
    };

    json["matcher"] = {
        {"exact_word", options.exact_word}
    };

    if (config_.use_custom_replacements) {
        nlohmann::json replacements = nlohmann::json::object();
        for (const auto& entry : config_.custom_replacements.entries()) {
            std::string key = common::StringUtils::to_utf8(std::u32string(1, entry.first));
            replacements[key] = common::StringUtils::to_utf8(std::u32string(1, entry.second));
        }
        json["character_replacements"] = replacements;
    }

    const common::LogConfig& logging = config_.logging;
    json["logging"] = {
        {"level", common::log_level_name(logging.level)},
        {"console_output", logging.console_output},
        {"file_output", logging.file_output},
        {"log_dir", logging.log_dir},
        {"log_file", logging.log_file},
        {"max_file_size", logging.max_file_size},
        {"max_files", logging.max_files}
    };

    return json;
}

bool ConfigManager::validate_options() const {
    const DetectorOptions& options = config_.options;
    if (options.exact_word && options.sanitize_spaces) {
        validation_errors_.push_back("exact_word cannot be combined with sanitize_spaces");
        return false;
    }
    return true;
}

bool ConfigManager::validate_logging() const {
    const common::LogConfig& logging = config_.logging;
    bool valid = true;

    if (logging.file_output && logging.log_file.empty()) {
        validation_errors_.push_back("log_file must be set when file_output is enabled");
        valid = false;
    }
    if (logging.max_file_size == 0) {
        validation_errors_.push_back("max_file_size must be greater than 0");
        valid = false;
    }
    if (logging.max_files == 0) {
        validation_errors_.push_back("max_files must be greater than 0");
        valid = false;
    }

    return valid;
}

bool ConfigManager::parse_bool(const std::string& param, const std::string& value) {
    std::string normalized = common::StringUtils::to_lower(common::StringUtils::trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw common::ConfigException("Invalid boolean for " + param + ": " + value);
}

char32_t ConfigManager::parse_character(const std::string& value) {
    std::u32string chars = common::StringUtils::to_utf32(value);
    if (chars.size() != 1) {
        throw common::ConfigException("Replacement entries must be single characters: \"" + value + "\"");
    }
    return chars[0];
}

} // namespace wordguard
