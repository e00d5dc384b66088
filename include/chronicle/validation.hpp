#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include "errors.hpp"

namespace chronicle {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw ValidationError(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw ValidationError(field_name + " must be non-negative");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw ValidationError(field_name + " must not be empty");
    }
}

/**
 * Require that a string contains at least one non-whitespace character.
 */
inline void require_not_blank(const std::string& value, const std::string& field_name = "value") {
    bool blank = std::all_of(value.begin(), value.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw ValidationError(field_name + " must not be blank");
    }
}

/**
 * Require that a state condition holds.
 */
inline void require_state(bool condition, const std::string& message) {
    if (!condition) {
        throw InvalidStateError(message);
    }
}

} // namespace validation
} // namespace chronicle
