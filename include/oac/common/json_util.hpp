#pragma once

#include "oac/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace oac::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

enum class JsonKind { String, Number, Bool, Null, Object, Array };

/// A top-level member of a JSON object. `text` holds the unescaped value for
/// strings and the raw JSON text for every other kind.
struct JsonValue {
  JsonKind kind = JsonKind::Null;
  std::string text;
};

using JsonObject = std::unordered_map<std::string, JsonValue>;

/// Strictly parse a JSON document that must be an object, returning its
/// top-level members. Fails with a Format error on any syntax error.
[[nodiscard]] Result<JsonObject> json_parse_object(const std::string &json);

/// Convert JSON number text to an integer, truncating any fraction.
[[nodiscard]] std::optional<std::int64_t> json_number_to_int64(const std::string &number);

/// Validate a JSON document and re-serialize it with one member per line.
/// Key order and number spelling are preserved; empty containers stay `{}`/`[]`.
[[nodiscard]] Result<std::string> json_pretty_print(const std::string &json,
                                                    std::size_t indent = 2);

} // namespace oac::common
