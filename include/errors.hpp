#pragma once

#include <stdexcept>
#include <string>

// Rejected controller/simulation configuration (bad Ts, inverted bounds, ...).
// Raised before any stepping takes place.
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument(what) {}
};

// Non-finite input reached the controller. A non-finite control signal is
// never applied, so this propagates instead of being clamped away.
class InvalidInput : public std::domain_error {
public:
    explicit InvalidInput(const std::string& what)
        : std::domain_error(what) {}
};
