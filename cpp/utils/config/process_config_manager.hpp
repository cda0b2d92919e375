#pragma once
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace config {

// Configuration value types
enum class ConfigType {
    STRING,
    INT,
    BOOL
};

// Configuration value wrapper
class ConfigValue {
public:
    ConfigValue() : type_(ConfigType::STRING), string_value_("") {}
    ConfigValue(const std::string& value) : type_(ConfigType::STRING), string_value_(value) {}
    ConfigValue(int value) : type_(ConfigType::INT), int_value_(value) {}
    ConfigValue(bool value) : type_(ConfigType::BOOL), bool_value_(value) {}

    std::string as_string() const {
        switch (type_) {
            case ConfigType::STRING: return string_value_;
            case ConfigType::INT: return std::to_string(int_value_);
            case ConfigType::BOOL: return bool_value_ ? "true" : "false";
            default: return "";
        }
    }

    int as_int() const {
        switch (type_) {
            case ConfigType::STRING: return std::stoi(string_value_);
            case ConfigType::INT: return int_value_;
            case ConfigType::BOOL: return bool_value_ ? 1 : 0;
            default: return 0;
        }
    }

    bool as_bool() const {
        switch (type_) {
            case ConfigType::STRING:
                return string_value_ == "true" || string_value_ == "1" || string_value_ == "yes";
            case ConfigType::INT: return int_value_ != 0;
            case ConfigType::BOOL: return bool_value_;
            default: return false;
        }
    }

    ConfigType get_type() const { return type_; }

private:
    ConfigType type_;
    std::string string_value_;
    int int_value_{0};
    bool bool_value_{false};
};

// Environment variable helpers
class EnvironmentConfig {
public:
    static std::string get_env_var(const std::string& name, const std::string& default_value = "");

    // Replaces every ${NAME} with the value of the environment variable NAME
    static std::string expand_env_vars(const std::string& input);
};

// Process configuration manager (INI sections of key = value pairs)
class ProcessConfigManager {
public:
    ProcessConfigManager();
    ~ProcessConfigManager() = default;

    // Configuration loading
    bool load_config(const std::string& config_file);
    bool load_config_from_string(const std::string& config_content);

    // Value access
    ConfigValue get_value(const std::string& section, const std::string& key, const ConfigValue& default_value) const;

    // Convenience methods. Malformed numbers fall back to the default
    // and are recorded as validation errors.
    std::string get_string(const std::string& section, const std::string& key, const std::string& default_value = "") const;
    int get_int(const std::string& section, const std::string& key, int default_value = 0) const;
    bool get_bool(const std::string& section, const std::string& key, bool default_value = false) const;

    // Comma separated values, trimmed, empty items dropped
    std::vector<std::string> get_list(const std::string& section, const std::string& key) const;

    bool has_key(const std::string& section, const std::string& key) const;

    // Configuration validation
    bool validate_config() const;
    std::vector<std::string> get_validation_errors() const;

    std::string get_log_file() const;

private:
    std::map<std::string, std::map<std::string, ConfigValue>> config_data_;
    mutable std::vector<std::string> validation_errors_;

    // Parsing helpers
    std::string trim(const std::string& str) const;
    bool is_section_line(const std::string& line) const;
    bool is_key_value_line(const std::string& line) const;
    std::string extract_section_name(const std::string& line) const;
    std::pair<std::string, std::string> extract_key_value(const std::string& line) const;

    // File I/O helpers
    std::string read_file(const std::string& filename) const;
};

} // namespace config
