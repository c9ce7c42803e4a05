#pragma once

#include "oac/common/error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace oac::common {

class Status {
public:
  static Status success() { return Status(std::nullopt); }
  static Status error(Error error) { return Status(std::move(error)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }

  [[nodiscard]] const Error &error() const {
    if (!error_.has_value()) {
      throw std::logic_error("Status has no error");
    }
    return *error_;
  }

private:
  explicit Status(std::optional<Error> error) : error_(std::move(error)) {}

  std::optional<Error> error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(Error error) { return Result(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_->to_string());
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_->to_string());
    }
    return *value_;
  }

  [[nodiscard]] const Error &error() const {
    if (ok()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

private:
  Result(std::optional<T> value, std::optional<Error> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<Error> error_;
};

} // namespace oac::common
