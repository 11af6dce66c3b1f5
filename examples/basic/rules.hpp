#pragma once

#include <string>
#include <string_view>

#include "jazzy/rule-set.hpp"

namespace jazzy::examples {

inline constexpr std::string_view kPasswordPattern = R"(^(?=.*[A-Z])(?=.*[a-z])(?=.*\d).*$)";
inline constexpr std::string_view kPasswordMessage =
    "Password must contain at least one uppercase letter, one lowercase letter, and one number";

inline constexpr std::string_view kSkuPattern = R"(^[A-Z]{2}\d{4}$)";
inline constexpr std::string_view kSkuMessage = "SKU must be in format XX0000";

class UserCreateRules : public RuleSet {
 public:
  UserCreateRules() {
    field("name").required().minLength(3).maxLength(50);
    field("email").required().email();
    field("password").required().minLength(8).pattern(kPasswordPattern, std::string(kPasswordMessage));
    field("role").in("admin", "user", "editor");
  }
};

class ProductCreateRules : public RuleSet {
 public:
  ProductCreateRules() {
    field("name").required().minLength(3).maxLength(100);
    field("description").required().minLength(10);
    field("price").required().numeric().min(0.01);
    field("category").required().in("electronics", "clothing", "books", "home", "sports");
    field("sku").required().pattern(kSkuPattern, std::string(kSkuMessage));
  }
};

}  // namespace jazzy::examples
