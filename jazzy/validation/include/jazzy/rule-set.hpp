#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jazzy/json-builder.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/validation-result.hpp"
#include "jazzy/validation-rule.hpp"

namespace jazzy {

class FieldRules;

// Ordered collection of rules per field name, replayable against any document.
// Reusable rule sets are typically declared by deriving from RuleSet and calling field() from the constructor:
//
//   class SignupRules : public RuleSet {
//    public:
//     SignupRules() {
//       field("email").required().email();
//       whenPresent("phone", [](RuleSet& rules) { rules.field("phone").numeric(); });
//     }
//   };
//
// Each field is evaluated independently, and only its first failing rule is recorded.
class RuleSet {
 public:
  using Condition = std::function<bool(const JsonObject& data)>;

  RuleSet() = default;

  RuleSet(const RuleSet&) = delete;
  RuleSet(RuleSet&&) noexcept = default;
  RuleSet& operator=(const RuleSet&) = delete;
  RuleSet& operator=(RuleSet&&) noexcept = default;

  virtual ~RuleSet() = default;

  // Starts (or continues) the rule list of field name.
  FieldRules field(std::string name);

  // Declares, through declare, rules that only apply when condition holds for the validated document.
  void when(Condition condition, const std::function<void(RuleSet&)>& declare);

  // Rules applying when field is present and not null.
  void whenPresent(std::string field, const std::function<void(RuleSet&)>& declare);

  // Rules applying when all fields are present and not null.
  void whenAllPresent(std::vector<std::string> fields, const std::function<void(RuleSet&)>& declare);

  // Rules applying when at least one of fields is present and not null.
  void whenAnyPresent(std::vector<std::string> fields, const std::function<void(RuleSet&)>& declare);

  void addRule(std::string_view field, ValidationRule rule);

  [[nodiscard]] ValidationResult validate(const JsonObject& data) const;

  [[nodiscard]] bool empty() const noexcept { return _fields.empty() && _groups.empty(); }

 private:
  friend class FieldRules;

  struct FieldEntry {
    std::string name;
    std::vector<ValidationRule> rules;
  };

  struct ConditionalGroup {
    Condition condition;
    std::unique_ptr<RuleSet> rules;
  };

  using ActiveRules = std::vector<std::pair<std::string_view, std::vector<const ValidationRule*>>>;

  std::size_t entryPos(std::string_view name);

  void collect(const JsonObject& data, ActiveRules& active) const;

  std::vector<FieldEntry> _fields;
  std::vector<ConditionalGroup> _groups;
};

// Fluent builder of the rules of one field. It refers to the RuleSet that created it and should not outlive it.
// Every rule but required() lets null and absent values pass.
class FieldRules {
 public:
  // The <field> field is required: fails on null and on empty strings.
  FieldRules& required();

  // String length in characters (UTF-8 code points). Non string values pass.
  FieldRules& minLength(std::size_t minLen);
  FieldRules& maxLength(std::size_t maxLen);

  FieldRules& email();

  // Numbers, and strings holding a number.
  FieldRules& numeric();

  // Numeric bounds, inclusive. Values that are neither numbers nor numeric strings pass.
  FieldRules& min(double minValue);
  FieldRules& max(double maxValue);

  // Whole string match of an ECMAScript regular expression. Throws std::regex_error if regex is invalid.
  FieldRules& pattern(std::string_view regex, std::string message);

  // http, https or ftp URL.
  FieldRules& url();

  FieldRules& alphanumeric();

  // See MatchesDateFormat.
  FieldRules& date(std::string_view format);

  // Value must be equal to one of allowed. Numbers compare by value.
  template <class... Args>
  FieldRules& in(Args&&... allowed) {
    return addMembershipRule(MakeJsonArray(std::forward<Args>(allowed)...), true);
  }

  // Value must differ from all of disallowed.
  template <class... Args>
  FieldRules& notIn(Args&&... disallowed) {
    return addMembershipRule(MakeJsonArray(std::forward<Args>(disallowed)...), false);
  }

  // Value must be equal to the value of otherField, unless one of them is null or absent.
  FieldRules& matches(std::string_view otherField);

  FieldRules& custom(ValidationRule rule);

  FieldRules& custom(std::function<bool(const JsonValue&)> predicate, std::string message);

  // Moves to another field of the same rule set.
  [[nodiscard]] FieldRules field(std::string name) const;

  // Validates the document bound to these rules (see Validator).
  // Throws std::logic_error if the rules were declared without document, as in a RuleSet constructor.
  [[nodiscard]] ValidationResult validate() const;

  [[nodiscard]] std::string_view name() const noexcept { return _ruleSet->_fields[_pos].name; }

 private:
  friend class RuleSet;
  friend class Validator;

  FieldRules(RuleSet* ruleSet, std::size_t pos, const JsonObject* data) noexcept
      : _ruleSet(ruleSet), _pos(pos), _data(data) {}

  FieldRules& add(ValidationRule::Predicate predicate, std::string message);

  FieldRules& addMembershipRule(JsonArray values, bool shouldBeIn);

  RuleSet* _ruleSet;
  std::size_t _pos;
  const JsonObject* _data;
};

}  // namespace jazzy
