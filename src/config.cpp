#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace idcrop {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

std::string Config::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

void Config::clear() {
    data_.clear();
    validation_errors_.clear();
}

void Config::parse(std::istream& in) {
    std::string line;
    std::string current_section;

    while (std::getline(in, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Key-value pair
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            data_[current_section][key] = value;
        }
    }
}

bool Config::load(const std::string& path) {
    clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::getInstance().debug("Config file not found: " + path);
        return false;
    }

    parse(file);

    bool valid = validate();

    // Log validation errors
    if (!validation_errors_.empty()) {
        Logger::getInstance().warning("Configuration validation found " +
            std::to_string(validation_errors_.size()) + " issue(s) in " + path + ":");
        for (const auto& error : validation_errors_) {
            Logger::getInstance().warning("  - " + error);
        }
    }

    return valid;
}

bool Config::loadFromString(const std::string& text) {
    clear();
    std::istringstream in(text);
    parse(in);

    bool valid = validate();
    for (const auto& error : validation_errors_) {
        Logger::getInstance().warning("Config: " + error);
    }
    return valid;
}

std::optional<std::string> Config::getString(const std::string& section, const std::string& key) const {
    auto section_it = data_.find(section);
    if (section_it == data_.end()) {
        return std::nullopt;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return std::nullopt;
    }

    return key_it->second;
}

std::optional<int> Config::getInt(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        int result = std::stoi(*value, &consumed);
        if (consumed != value->size()) return std::nullopt;
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> Config::getDouble(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        double result = std::stod(*value, &consumed);
        if (consumed != value->size()) return std::nullopt;
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> Config::getBool(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    std::string lower = toLower(*value);

    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        return true;
    } else if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        return false;
    }

    return std::nullopt;
}

bool Config::validateInt(const std::string& section, const std::string& key, int min_val, int max_val) {
    if (!getString(section, key)) {
        return true;  // Optional value, not set
    }

    auto value = getInt(section, key);
    if (!value.has_value()) {
        validation_errors_.push_back("[" + section + "]." + key + " is not an integer");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validateDouble(const std::string& section, const std::string& key, double min_val, double max_val) {
    if (!getString(section, key)) {
        return true;  // Optional value, not set
    }

    auto value = getDouble(section, key);
    if (!value.has_value()) {
        validation_errors_.push_back("[" + section + "]." + key + " is not a number");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validateBool(const std::string& section, const std::string& key) {
    if (getString(section, key) && !getBool(section, key)) {
        validation_errors_.push_back("[" + section + "]." + key + " must be true or false");
        return false;
    }
    return true;
}

bool Config::validateChoice(const std::string& section, const std::string& key,
                            const std::vector<std::string>& choices) {
    auto value = getString(section, key);
    if (!value) {
        return true;
    }

    const std::string lower = toLower(*value);
    if (std::find(choices.begin(), choices.end(), lower) != choices.end()) {
        return true;
    }

    std::string allowed;
    for (const auto& choice : choices) {
        allowed += (allowed.empty() ? "" : "|") + choice;
    }
    validation_errors_.push_back("[" + section + "]." + key + " = " + *value +
                                 " (expected " + allowed + ")");
    return false;
}

bool Config::validate() {
    bool all_valid = true;

    // Detection
    all_valid &= validateChoice("detection", "backend", {"auto", "model", "cascade"});
    all_valid &= validateDouble("detection", "min_confidence", 0.1, 0.99);
    all_valid &= validateInt("detection", "threads", 1, 64);

    // Cropping and selection
    all_valid &= validateInt("crop", "margin_percent", 0, 40);
    all_valid &= validateChoice("selection", "mode", {"largest", "all"});
    all_valid &= validateInt("selection", "max_faces", 1, 10);

    // Output
    all_valid &= validateInt("output", "jpeg_quality", 1, 100);
    all_valid &= validateBool("output", "overlay");

    // Logging
    all_valid &= validateChoice("logging", "level", {"debug", "info", "warning", "warn", "error"});
    all_valid &= validateInt("logging", "max_lines", 10, 100000);

    return all_valid;
}

} // namespace idcrop
