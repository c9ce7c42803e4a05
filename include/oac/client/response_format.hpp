#pragma once

#include "oac/common/result.hpp"

#include <string>

namespace oac::client {

inline constexpr const char *NO_CONTENT_MESSAGE = "Request succeeded (no content).";

/// Renders a successful response body for the terminal. Bodies that look
/// like JSON must parse; anything else is passed through trimmed.
[[nodiscard]] common::Result<std::string> format_response_body(const std::string &body);

} // namespace oac::client
