#pragma once

#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

namespace parseutil {

inline std::string trimCopy(std::string_view s) {
    size_t start = 0;
    while (start < s.size() &&
           std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

inline double parseDoubleStrict(const std::string& raw_value, const std::string& context) {
    const std::string value = trimCopy(raw_value);
    if (value.empty()) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected number, got empty");
    }

    try {
        size_t idx = 0;
        const double parsed = std::stod(value, &idx);
        if (idx != value.size()) {
            throw std::runtime_error("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected number, got '" + raw_value + "'");
    }
}

inline int parseIntStrict(const std::string& raw_value, const std::string& context) {
    const std::string value = trimCopy(raw_value);
    if (value.empty()) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected integer, got empty");
    }

    try {
        size_t idx = 0;
        const int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw std::runtime_error("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected integer, got '" + raw_value + "'");
    }
}

inline bool parseBoolStrict(const std::string& raw_value, const std::string& context) {
    const std::string value = trimCopy(raw_value);
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::runtime_error("Invalid value for " + context +
                             ": expected bool, got '" + raw_value + "'");
}

}  // namespace parseutil
