#include "jazzy/validator.hpp"

#include <string>
#include <utility>

#include "jazzy/rule-set.hpp"
#include "jazzy/validation-result.hpp"

namespace jazzy {

FieldRules Validator::field(std::string name) {
  FieldRules rules = _rules.field(std::move(name));
  rules._data = &_data;
  return rules;
}

ValidationResult Validator::validate(const RuleSet& ruleSet) const {
  ValidationResult result = _rules.validate(_data);
  result.merge(ruleSet.validate(_data));
  return result;
}

}  // namespace jazzy
