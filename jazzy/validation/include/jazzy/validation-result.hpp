#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "jazzy/json-value.hpp"

namespace jazzy {

// Outcome of a validation: for each failing field, its ordered list of error messages.
// A result is valid if and only if it holds no error.
class ValidationResult {
 public:
  using ErrorMap = std::map<std::string, std::vector<std::string>, std::less<>>;

  void addError(std::string_view field, std::string message);

  [[nodiscard]] bool isValid() const noexcept { return _errors.empty(); }

  [[nodiscard]] bool failed() const noexcept { return !isValid(); }

  [[nodiscard]] const ErrorMap& errors() const noexcept { return _errors; }

  // Messages recorded for field, empty if none.
  [[nodiscard]] std::span<const std::string> fieldErrors(std::string_view field) const noexcept;

  [[nodiscard]] std::optional<std::string_view> firstError(std::string_view field) const noexcept;

  // First message of each failing field.
  [[nodiscard]] std::map<std::string, std::string, std::less<>> firstErrors() const;

  // firstErrors() rendered as "{field1=message1, field2=message2}".
  [[nodiscard]] std::string firstErrorsString() const;

  [[nodiscard]] bool hasError(std::string_view field) const noexcept { return !fieldErrors(field).empty(); }

  // Total number of messages, all fields included.
  [[nodiscard]] std::size_t errorCount() const noexcept;

  // Appends all messages of other to this result.
  ValidationResult& merge(const ValidationResult& other);

  // JSON view of errors(): {"field": ["message", ...], ...}
  [[nodiscard]] JsonObject errorsJson() const;

  template <class F>
  const ValidationResult& onSuccess(F&& callback) const {
    if (isValid()) {
      std::forward<F>(callback)();
    }
    return *this;
  }

  template <class F>
  const ValidationResult& onFailure(F&& callback) const {
    if (failed()) {
      std::forward<F>(callback)(_errors);
    }
    return *this;
  }

  // Projects the result: onSuccess() if valid, onFailure(errors()) otherwise. Both must return the same type.
  template <class OnSuccess, class OnFailure>
  std::invoke_result_t<OnSuccess> fold(OnSuccess&& onSuccess, OnFailure&& onFailure) const {
    static_assert(std::is_same_v<std::invoke_result_t<OnSuccess>, std::invoke_result_t<OnFailure, const ErrorMap&>>,
                  "both projections should return the same type");
    if (isValid()) {
      return std::forward<OnSuccess>(onSuccess)();
    }
    return std::forward<OnFailure>(onFailure)(_errors);
  }

  template <class F>
  std::optional<std::invoke_result_t<F>> onValidationSuccess(F&& action) const {
    if (isValid()) {
      return std::forward<F>(action)();
    }
    return std::nullopt;
  }

  template <class F>
  std::optional<std::invoke_result_t<F, const ErrorMap&>> onValidationFailure(F&& action) const {
    if (failed()) {
      return std::forward<F>(action)(_errors);
    }
    return std::nullopt;
  }

  bool operator==(const ValidationResult&) const = default;

 private:
  ErrorMap _errors;
};

}  // namespace jazzy
