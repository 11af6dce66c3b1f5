#include "jazzy/rule-set.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jazzy/date-format.hpp"
#include "jazzy/json-encode.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/stringconv.hpp"
#include "jazzy/validation-result.hpp"
#include "jazzy/validation-rule.hpp"

namespace jazzy {

namespace {

const JsonValue kAbsentValue{};

bool IsPresent(const JsonObject& data, std::string_view field) {
  const JsonValue* value = data.find(field);
  return value != nullptr && !value->isNull();
}

std::optional<double> NumericValue(const JsonValue& value) {
  if (value.isNumber()) {
    return value.asDouble();
  }
  if (value.isString()) {
    return TryStringToDouble(value.asString());
  }
  return std::nullopt;
}

std::size_t CodePointCount(std::string_view str) {
  return static_cast<std::size_t>(
      std::ranges::count_if(str, [](char ch) { return (static_cast<unsigned char>(ch) & 0xC0) != 0x80; }));
}

bool SameValue(const JsonValue& lhs, const JsonValue& rhs) {
  if (lhs.isNumber() && rhs.isNumber()) {
    return lhs.asDouble() == rhs.asDouble();
  }
  return lhs == rhs;
}

// "[admin, user]": strings are written without quotes.
std::string ListString(const JsonArray& values) {
  std::string ret(1, '[');
  for (const JsonValue& value : values) {
    if (ret.size() > 1) {
      ret.append(", ");
    }
    if (value.isString()) {
      ret.append(value.asString());
    } else {
      AppendJson(ret, value);
    }
  }
  ret.push_back(']');
  return ret;
}

ValidationRule::Predicate SkipNull(std::function<bool(const JsonValue&)> predicate) {
  return [predicate = std::move(predicate)](const JsonValue& value, const JsonObject&) {
    return value.isNull() || predicate(value);
  };
}

// Applies a full match of regex to string values, other types pass.
std::function<bool(const JsonValue&)> StringMatcher(std::shared_ptr<const std::regex> regex) {
  return [regex = std::move(regex)](const JsonValue& value) {
    return !value.isString() || std::regex_match(value.asString(), *regex);
  };
}

const std::shared_ptr<const std::regex>& EmailRegex() {
  static const auto kRegex = std::make_shared<const std::regex>(
      R"(^[a-zA-Z0-9_+&*-]+(?:\.[a-zA-Z0-9_+&*-]+)*@(?:[a-zA-Z0-9-]+\.)+[a-zA-Z]{2,7}$)");
  return kRegex;
}

const std::shared_ptr<const std::regex>& UrlRegex() {
  static const auto kRegex = std::make_shared<const std::regex>(R"(^(https?|ftp)://[^\s/$.?#].[^\s]*$)");
  return kRegex;
}

const std::shared_ptr<const std::regex>& AlphanumericRegex() {
  static const auto kRegex = std::make_shared<const std::regex>("^[a-zA-Z0-9]*$");
  return kRegex;
}

}  // namespace

FieldRules RuleSet::field(std::string name) { return FieldRules(this, entryPos(name), nullptr); }

std::size_t RuleSet::entryPos(std::string_view name) {
  auto it = std::ranges::find(_fields, name, &FieldEntry::name);
  if (it == _fields.end()) {
    _fields.push_back(FieldEntry{std::string(name), {}});
    return _fields.size() - 1U;
  }
  return static_cast<std::size_t>(it - _fields.begin());
}

void RuleSet::addRule(std::string_view field, ValidationRule rule) {
  _fields[entryPos(field)].rules.push_back(std::move(rule));
}

void RuleSet::when(Condition condition, const std::function<void(RuleSet&)>& declare) {
  auto rules = std::make_unique<RuleSet>();
  declare(*rules);
  _groups.push_back(ConditionalGroup{std::move(condition), std::move(rules)});
}

void RuleSet::whenPresent(std::string field, const std::function<void(RuleSet&)>& declare) {
  when([field = std::move(field)](const JsonObject& data) { return IsPresent(data, field); }, declare);
}

void RuleSet::whenAllPresent(std::vector<std::string> fields, const std::function<void(RuleSet&)>& declare) {
  when(
      [fields = std::move(fields)](const JsonObject& data) {
        return std::ranges::all_of(fields, [&data](const std::string& field) { return IsPresent(data, field); });
      },
      declare);
}

void RuleSet::whenAnyPresent(std::vector<std::string> fields, const std::function<void(RuleSet&)>& declare) {
  when(
      [fields = std::move(fields)](const JsonObject& data) {
        return std::ranges::any_of(fields, [&data](const std::string& field) { return IsPresent(data, field); });
      },
      declare);
}

void RuleSet::collect(const JsonObject& data, ActiveRules& active) const {
  for (const FieldEntry& entry : _fields) {
    auto it = std::ranges::find(active, std::string_view(entry.name), &ActiveRules::value_type::first);
    if (it == active.end()) {
      active.emplace_back(entry.name, std::vector<const ValidationRule*>{});
      it = std::prev(active.end());
    }
    for (const ValidationRule& rule : entry.rules) {
      it->second.push_back(&rule);
    }
  }
  for (const ConditionalGroup& group : _groups) {
    if (group.condition(data)) {
      group.rules->collect(data, active);
    }
  }
}

ValidationResult RuleSet::validate(const JsonObject& data) const {
  ActiveRules active;
  collect(data, active);

  ValidationResult result;
  for (const auto& [field, rules] : active) {
    const JsonValue* value = data.find(field);
    const JsonValue& fieldValue = value == nullptr ? kAbsentValue : *value;
    for (const ValidationRule* rule : rules) {
      if (!rule->predicate(fieldValue, data)) {
        result.addError(field, rule->message);
        break;
      }
    }
  }
  return result;
}

FieldRules& FieldRules::add(ValidationRule::Predicate predicate, std::string message) {
  _ruleSet->_fields[_pos].rules.push_back(ValidationRule{std::move(predicate), std::move(message)});
  return *this;
}

FieldRules& FieldRules::required() {
  return add(
      [](const JsonValue& value, const JsonObject&) {
        return !value.isNull() && (!value.isString() || !value.asString().empty());
      },
      fmt::format("The {} field is required", name()));
}

FieldRules& FieldRules::minLength(std::size_t minLen) {
  return add(SkipNull([minLen](const JsonValue& value) {
               return !value.isString() || CodePointCount(value.asString()) >= minLen;
             }),
             fmt::format("The {} field must be at least {} characters", name(), minLen));
}

FieldRules& FieldRules::maxLength(std::size_t maxLen) {
  return add(SkipNull([maxLen](const JsonValue& value) {
               return !value.isString() || CodePointCount(value.asString()) <= maxLen;
             }),
             fmt::format("The {} field must not exceed {} characters", name(), maxLen));
}

FieldRules& FieldRules::email() {
  return add(SkipNull(StringMatcher(EmailRegex())), fmt::format("The {} field must be a valid email address", name()));
}

FieldRules& FieldRules::numeric() {
  return add(SkipNull([](const JsonValue& value) { return NumericValue(value).has_value(); }),
             fmt::format("The {} field must be numeric", name()));
}

FieldRules& FieldRules::min(double minValue) {
  return add(SkipNull([minValue](const JsonValue& value) {
               auto number = NumericValue(value);
               return !number || *number >= minValue;
             }),
             fmt::format("The {} field must be at least {}", name(), DoubleToString(minValue)));
}

FieldRules& FieldRules::max(double maxValue) {
  return add(SkipNull([maxValue](const JsonValue& value) {
               auto number = NumericValue(value);
               return !number || *number <= maxValue;
             }),
             fmt::format("The {} field must not exceed {}", name(), DoubleToString(maxValue)));
}

FieldRules& FieldRules::pattern(std::string_view regex, std::string message) {
  auto compiled = std::make_shared<const std::regex>(regex.begin(), regex.end());
  return add(SkipNull(StringMatcher(std::move(compiled))), std::move(message));
}

FieldRules& FieldRules::url() {
  return add(SkipNull(StringMatcher(UrlRegex())), fmt::format("The {} field must be a valid URL", name()));
}

FieldRules& FieldRules::alphanumeric() {
  return add(SkipNull(StringMatcher(AlphanumericRegex())),
             fmt::format("The {} field must only contain letters and numbers", name()));
}

FieldRules& FieldRules::date(std::string_view format) {
  return add(SkipNull([format = std::string(format)](const JsonValue& value) {
               return !value.isString() || MatchesDateFormat(value.asString(), format);
             }),
             fmt::format("The {} field must be a valid date in format {}", name(), format));
}

FieldRules& FieldRules::addMembershipRule(JsonArray values, bool shouldBeIn) {
  std::string message = fmt::format("The {} field must {}be one of: {}", name(), shouldBeIn ? "" : "not ",
                                    ListString(values));
  return add(SkipNull([values = std::move(values), shouldBeIn](const JsonValue& value) {
               const bool found = std::ranges::any_of(
                   values, [&value](const JsonValue& candidate) { return SameValue(candidate, value); });
               return found == shouldBeIn;
             }),
             std::move(message));
}

FieldRules& FieldRules::matches(std::string_view otherField) {
  return add(
      [otherField = std::string(otherField)](const JsonValue& value, const JsonObject& data) {
        if (value.isNull()) {
          return true;
        }
        const JsonValue* otherValue = data.find(otherField);
        return otherValue == nullptr || otherValue->isNull() || SameValue(value, *otherValue);
      },
      fmt::format("The {} field must match the {} field", name(), otherField));
}

FieldRules& FieldRules::custom(ValidationRule rule) {
  _ruleSet->_fields[_pos].rules.push_back(std::move(rule));
  return *this;
}

FieldRules& FieldRules::custom(std::function<bool(const JsonValue&)> predicate, std::string message) {
  return add([predicate = std::move(predicate)](const JsonValue& value,
                                                const JsonObject&) { return predicate(value); },
             std::move(message));
}

FieldRules FieldRules::field(std::string name) const {
  FieldRules next = _ruleSet->field(std::move(name));
  next._data = _data;
  return next;
}

ValidationResult FieldRules::validate() const {
  if (_data == nullptr) {
    throw std::logic_error("No document is bound to these rules, use RuleSet::validate(data) instead");
  }
  return _ruleSet->validate(*_data);
}

}  // namespace jazzy
