#ifndef IDCROP_CONFIG_H
#define IDCROP_CONFIG_H

#include <string>
#include <map>
#include <optional>
#include <vector>

namespace idcrop {

// INI configuration: [section] headers, key = value pairs, '#'/';' comments
class Config {
public:
    static Config& getInstance();

    // Replaces any previously loaded values. Returns false if the file can't
    // be opened or fails validation (values are kept either way).
    bool load(const std::string& path);

    // Same as load() for in-memory text
    bool loadFromString(const std::string& text);

    void clear();

    std::optional<std::string> getString(const std::string& section, const std::string& key) const;
    std::optional<int> getInt(const std::string& section, const std::string& key) const;
    std::optional<double> getDouble(const std::string& section, const std::string& key) const;
    std::optional<bool> getBool(const std::string& section, const std::string& key) const;

    // Get validation errors from last load
    std::vector<std::string> getValidationErrors() const { return validation_errors_; }

private:
    Config() = default;
    std::map<std::string, std::map<std::string, std::string>> data_;
    std::vector<std::string> validation_errors_;

    std::string trim(const std::string& str) const;
    void parse(std::istream& in);
    bool validate();
    bool validateInt(const std::string& section, const std::string& key, int min_val, int max_val);
    bool validateDouble(const std::string& section, const std::string& key, double min_val, double max_val);
    bool validateBool(const std::string& section, const std::string& key);
    bool validateChoice(const std::string& section, const std::string& key,
                        const std::vector<std::string>& choices);
};

} // namespace idcrop

#endif // IDCROP_CONFIG_H
