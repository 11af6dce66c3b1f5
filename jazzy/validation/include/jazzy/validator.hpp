#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "jazzy/json-value.hpp"
#include "jazzy/rule-set.hpp"
#include "jazzy/validation-result.hpp"

namespace jazzy {

// Ad-hoc validation of one document:
//   auto result = request.validator().field("name").required().minLength(3).field("email").email().validate();
// FieldRules obtained from a Validator refer to it: the Validator is neither copyable nor movable.
class Validator {
 public:
  explicit Validator(JsonObject data) noexcept : _data(std::move(data)) {}

  Validator(const Validator&) = delete;
  Validator(Validator&&) = delete;
  Validator& operator=(const Validator&) = delete;
  Validator& operator=(Validator&&) = delete;

  ~Validator() = default;

  [[nodiscard]] FieldRules field(std::string name);

  // Value of field, nullptr if absent.
  [[nodiscard]] const JsonValue* value(std::string_view field) const noexcept { return _data.find(field); }

  [[nodiscard]] const JsonObject& data() const noexcept { return _data; }

  [[nodiscard]] ValidationResult validate() const { return _rules.validate(_data); }

  // Replays a reusable rule set on this document, in addition to the rules declared through field().
  [[nodiscard]] ValidationResult validate(const RuleSet& ruleSet) const;

 private:
  JsonObject _data;
  RuleSet _rules;
};

}  // namespace jazzy
