#pragma once

#include "parse_utils.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Controller definition from a [[controller]] config section
struct ControllerConfigEntry {
    std::string name;
    double kp = 0.0;
    double ki = 0.0;
    bool anti_windup = true;
};

// Simple key=value config file parser with [[controller]] section support
class Config {
public:
    static Config load(const std::string& filename);

    // Check if controller sections were defined
    bool hasControllers() const {
        return !controllers_.empty();
    }

    // Get controller definitions
    const std::vector<ControllerConfigEntry>& getControllerEntries() const {
        return controllers_;
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    // Set or replace a global value (command-line overrides)
    void set(const std::string& key, const std::string& value) {
        values_[key] = parseutil::trimCopy(value);
    }

    // Drop a global value so readers fall back to their default
    void erase(const std::string& key) {
        values_.erase(key);
    }

    std::string getString(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            throw std::runtime_error("Missing config key: " + key);
        }
        return it->second;
    }

    std::string getString(const std::string& key, const std::string& default_val) const {
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    double getDouble(const std::string& key) const {
        return parseutil::parseDoubleStrict(getString(key), "'" + key + "'");
    }

    double getDouble(const std::string& key, double default_val) const {
        if (!has(key)) return default_val;
        return getDouble(key);
    }

    int getInt(const std::string& key) const {
        return parseutil::parseIntStrict(getString(key), "'" + key + "'");
    }

    int getInt(const std::string& key, int default_val) const {
        if (!has(key)) return default_val;
        return getInt(key);
    }

    bool getBool(const std::string& key, bool default_val) const {
        if (!has(key)) return default_val;
        return parseutil::parseBoolStrict(getString(key), "'" + key + "'");
    }

private:
    std::map<std::string, std::string> values_;
    std::vector<ControllerConfigEntry> controllers_;
};
