#pragma once

#include <functional>
#include <string>

#include "jazzy/json-value.hpp"

namespace jazzy {

// A predicate over the value of one field, along with the message recorded when it does not hold.
// Absent fields are presented as a null value. data is the whole document being validated, for rules
// comparing several fields.
struct ValidationRule {
  using Predicate = std::function<bool(const JsonValue& value, const JsonObject& data)>;

  Predicate predicate;
  std::string message;
};

}  // namespace jazzy
