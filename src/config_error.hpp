#pragma once

#include <stdexcept>
#include <string>

// Thrown by public entry points when a parameter makes the computation
// undefined (fewer than 2 color stops, fewer than 2 color levels).
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
