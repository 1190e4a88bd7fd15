#pragma once

/// @file id.hpp
/// @brief Identifier generation for pulse_core

#include <string>

namespace pulse_core {

/// Generate a random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form
[[nodiscard]] std::string generate_uuid();

/// Check whether a string is a canonical version 4 UUID
[[nodiscard]] bool is_uuid_v4(const std::string& str) noexcept;

} // namespace pulse_core
