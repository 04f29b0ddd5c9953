/**
 * @file errors.hpp
 * @brief Run-level error type.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace kotrack {

/**
 * @brief Terminal run-level error: nothing to process or unusable configuration.
 *
 * Malformed hands never raise; they degrade to fewer knockouts counted.
 * InputError is reserved for conditions that indicate a configuration
 * mistake rather than a bad hand record.
 */
class InputError : public std::runtime_error {
public:
    enum class Kind {
        NoInput,
        BadConfig
    };

    InputError(const std::string& message, Kind kind)
        : std::runtime_error(message), kind_(kind) {}

    static InputError no_input(const std::string& message) {
        return InputError(message, Kind::NoInput);
    }

    static InputError bad_config(const std::string& message) {
        return InputError(message, Kind::BadConfig);
    }

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

} // namespace kotrack
