#include "process_config_manager.hpp"
#include "../logging/log_helper.hpp"
#include <cstdlib>
#include <stdexcept>

namespace config {

std::string EnvironmentConfig::get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string EnvironmentConfig::expand_env_vars(const std::string& input) {
    std::string result = input;
    size_t start = 0;

    while ((start = result.find("${", start)) != std::string::npos) {
        size_t end = result.find("}", start);
        if (end == std::string::npos) break;

        std::string var_name = result.substr(start + 2, end - start - 2);
        std::string var_value = get_env_var(var_name);

        result.replace(start, end - start + 1, var_value);
        start += var_value.length();
    }

    return result;
}

ProcessConfigManager::ProcessConfigManager() {
    // Initialize with empty configuration
}

bool ProcessConfigManager::load_config(const std::string& config_file) {
    try {
        std::string content = read_file(config_file);
        return load_config_from_string(content);
    } catch (const std::exception& e) {
        LOG_ERROR_COMP("CONFIG", "Error loading config file " + config_file + ": " + e.what());
        return false;
    }
}

bool ProcessConfigManager::load_config_from_string(const std::string& config_content) {
    config_data_.clear();
    validation_errors_.clear();

    std::istringstream stream(config_content);
    std::string line;
    std::string current_section;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (is_section_line(line)) {
            current_section = extract_section_name(line);
            config_data_[current_section];
        } else if (is_key_value_line(line)) {
            if (current_section.empty()) {
                validation_errors_.push_back("Key-value pair found outside of section: " + line);
                continue;
            }

            auto [key, value] = extract_key_value(line);
            if (key.empty()) {
                validation_errors_.push_back("Empty key in section [" + current_section + "]");
                continue;
            }
            config_data_[current_section][key] = ConfigValue(EnvironmentConfig::expand_env_vars(value));
        } else {
            validation_errors_.push_back("Unrecognized line: " + line);
        }
    }

    return validation_errors_.empty();
}

ConfigValue ProcessConfigManager::get_value(const std::string& section, const std::string& key, const ConfigValue& default_value) const {
    auto section_it = config_data_.find(section);
    if (section_it == config_data_.end()) {
        return default_value;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return default_value;
    }

    return key_it->second;
}

std::string ProcessConfigManager::get_string(const std::string& section, const std::string& key, const std::string& default_value) const {
    return get_value(section, key, ConfigValue(default_value)).as_string();
}

int ProcessConfigManager::get_int(const std::string& section, const std::string& key, int default_value) const {
    try {
        return get_value(section, key, ConfigValue(default_value)).as_int();
    } catch (const std::exception&) {
        validation_errors_.push_back("Invalid integer for [" + section + "] " + key);
        return default_value;
    }
}

bool ProcessConfigManager::get_bool(const std::string& section, const std::string& key, bool default_value) const {
    return get_value(section, key, ConfigValue(default_value)).as_bool();
}

std::vector<std::string> ProcessConfigManager::get_list(const std::string& section, const std::string& key) const {
    std::vector<std::string> items;
    std::istringstream stream(get_string(section, key, ""));
    std::string item;

    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool ProcessConfigManager::has_key(const std::string& section, const std::string& key) const {
    auto section_it = config_data_.find(section);
    if (section_it == config_data_.end()) {
        return false;
    }
    return section_it->second.find(key) != section_it->second.end();
}

bool ProcessConfigManager::validate_config() const {
    for (const auto& [section, keys] : config_data_) {
        if (section.empty()) {
            validation_errors_.push_back("Empty section name");
        }
    }
    return validation_errors_.empty();
}

std::vector<std::string> ProcessConfigManager::get_validation_errors() const {
    return validation_errors_;
}

std::string ProcessConfigManager::get_log_file() const {
    return get_string("logging", "file", "");
}

std::string ProcessConfigManager::trim(const std::string& str) const {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool ProcessConfigManager::is_section_line(const std::string& line) const {
    return line.length() >= 3 && line[0] == '[' && line[line.length() - 1] == ']';
}

bool ProcessConfigManager::is_key_value_line(const std::string& line) const {
    return line.find('=') != std::string::npos;
}

std::string ProcessConfigManager::extract_section_name(const std::string& line) const {
    return trim(line.substr(1, line.length() - 2));
}

std::pair<std::string, std::string> ProcessConfigManager::extract_key_value(const std::string& line) const {
    size_t eq_pos = line.find('=');
    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    return {key, value};
}

std::string ProcessConfigManager::read_file(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

} // namespace config
