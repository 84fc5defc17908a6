#pragma once

#include <stdexcept>
#include <string>

namespace sheltercontrol {

// Input-contract violations. These reach the immediate caller; everything
// else in the engine degrades into warnings instead of throwing.

// A window whose start lies after its end.
class InvalidWindow : public std::runtime_error {
public:
    explicit InvalidWindow(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// A month outside 1-12 (or a year that cannot be represented).
class InvalidPeriod : public std::runtime_error {
public:
    explicit InvalidPeriod(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

class InvalidConfig : public std::runtime_error {
public:
    explicit InvalidConfig(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace sheltercontrol
