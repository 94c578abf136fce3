#include "config.hpp"

#include <fstream>
#include <vector>

namespace {

struct ControllerRequiredFields {
    bool name = false;
    bool kp = false;
    bool ki = false;
};

std::string stripInlineComment(const std::string& s) {
    size_t hash = s.find('#');
    if (hash == std::string::npos) {
        return s;
    }
    return s.substr(0, hash);
}

void validateControllerSection(const ControllerRequiredFields& fields, int section_start_line) {
    std::vector<std::string> missing;
    if (!fields.name) missing.push_back("name");
    if (!fields.kp) missing.push_back("kp");
    if (!fields.ki) missing.push_back("ki");

    if (missing.empty()) {
        return;
    }

    std::string msg = "Missing required controller parameter(s) in [[controller]] section starting at line " +
                      std::to_string(section_start_line) + ": ";
    for (size_t i = 0; i < missing.size(); ++i) {
        msg += missing[i];
        if (i + 1 < missing.size()) {
            msg += ", ";
        }
    }
    throw std::runtime_error(msg);
}

double parseDoubleAtLine(const std::string& value, const std::string& key, int line_num) {
    try {
        return parseutil::parseDoubleStrict(value, "'" + key + "'");
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for '" + key + "' at line " +
                                 std::to_string(line_num) + ": " + value);
    }
}

bool parseBoolAtLine(const std::string& value, const std::string& key, int line_num) {
    try {
        return parseutil::parseBoolStrict(value, "'" + key + "'");
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for '" + key + "' at line " +
                                 std::to_string(line_num) + ": " + value);
    }
}

}  // namespace

Config Config::load(const std::string& filename) {
    Config config;
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    std::string line;
    int line_num = 0;
    bool in_controller_section = false;
    int section_start_line = -1;
    ControllerConfigEntry current;
    ControllerRequiredFields fields;
    auto finalizeControllerSection = [&]() {
        validateControllerSection(fields, section_start_line);
        for (const auto& existing : config.controllers_) {
            if (existing.name == current.name) {
                throw std::runtime_error("Duplicate controller name '" + current.name +
                                         "' in section starting at line " +
                                         std::to_string(section_start_line));
            }
        }
        config.controllers_.push_back(current);
    };

    while (std::getline(file, line)) {
        line_num++;

        // Strip inline comments, then skip empty lines
        std::string uncommented = stripInlineComment(line);
        std::string trimmed = parseutil::trimCopy(uncommented);
        if (trimmed.empty()) {
            continue;
        }

        if (trimmed == "[[controller]]") {
            if (in_controller_section) {
                finalizeControllerSection();
            }
            in_controller_section = true;
            section_start_line = line_num;
            current = ControllerConfigEntry();
            fields = ControllerRequiredFields();
            continue;
        }

        size_t eq = uncommented.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Invalid config line " + std::to_string(line_num) + ": " + line);
        }

        std::string key = parseutil::trimCopy(uncommented.substr(0, eq));
        std::string value = parseutil::trimCopy(uncommented.substr(eq + 1));

        if (key.empty()) {
            throw std::runtime_error("Empty key at line " + std::to_string(line_num));
        }

        if (in_controller_section) {
            if (key == "name") {
                if (value.empty()) {
                    throw std::runtime_error("Empty controller name at line " + std::to_string(line_num));
                }
                current.name = value;
                fields.name = true;
            } else if (key == "kp") {
                current.kp = parseDoubleAtLine(value, key, line_num);
                fields.kp = true;
            } else if (key == "ki") {
                current.ki = parseDoubleAtLine(value, key, line_num);
                fields.ki = true;
            } else if (key == "anti_windup") {
                current.anti_windup = parseBoolAtLine(value, key, line_num);
            } else {
                throw std::runtime_error("Unknown controller parameter '" + key + "' at line " +
                                         std::to_string(line_num));
            }
        } else {
            // Global key=value
            config.values_[key] = value;
        }
    }

    if (in_controller_section) {
        finalizeControllerSection();
    }

    return config;
}
