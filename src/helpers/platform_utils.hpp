#pragma once

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace itinera::platform
{
    /**
     * Get the value of an environment variable
     *
     * @param name The name of the environment variable
     * @return The value of the environment variable or empty string if not set
     */
    inline std::string get_env(const std::string& name)
    {
        const char* value = std::getenv(name.c_str());
        return value ? std::string(value) : std::string();
    }

    /**
     * Get the value of an environment variable, or a fallback when it is unset or empty
     */
    inline std::string get_env_or(const std::string& name, const std::string& fallback)
    {
        auto value = get_env(name);
        return value.empty() ? fallback : value;
    }

    /**
     * Read a numeric environment variable. Unset yields nullopt; a value that
     * does not parse is reported instead of being silently ignored.
     */
    inline std::optional<double> get_env_number(const std::string& name)
    {
        auto value = get_env(name);
        if (value.empty()) {
            return std::nullopt;
        }
        try {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Environment variable " + name + " is not a number: " + value);
        }
    }
}
