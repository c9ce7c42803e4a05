#include "oac/client/response_format.hpp"

#include "oac/common/fs.hpp"
#include "oac/common/json_util.hpp"

namespace oac::client {

common::Result<std::string> format_response_body(const std::string &body) {
  const std::string trimmed = common::trim(body);
  if (trimmed.empty()) {
    return common::Result<std::string>::success(NO_CONTENT_MESSAGE);
  }
  if (trimmed.front() == '{' || trimmed.front() == '[') {
    return common::json_pretty_print(trimmed);
  }
  return common::Result<std::string>::success(trimmed);
}

} // namespace oac::client
