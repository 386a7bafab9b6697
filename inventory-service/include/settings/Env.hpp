#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace inventory::settings::env {

inline std::string getOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : defaultValue;
}

/**
 * @brief Целое из окружения в диапазоне [min, max]
 * @throws std::invalid_argument если значение не число или вне диапазона
 */
inline int getIntInRange(const char* name, int defaultValue, int min, int max) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return defaultValue;

    size_t parsed = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &parsed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + raw);
    }
    if (raw[parsed] != '\0') {
        throw std::invalid_argument(std::string(name) + " is not a number: " + raw);
    }
    if (value < min || value > max) {
        throw std::invalid_argument(std::string(name) + " out of range [" + std::to_string(min) +
                                    ", " + std::to_string(max) + "]: " + raw);
    }
    return value;
}

} // namespace inventory::settings::env
