#include "jazzy/json-convert.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jazzy/invalid-argument-exception.hpp"
#include "jazzy/json-builder.hpp"
#include "jazzy/json-encode.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

namespace {

struct Person {
  std::string name;
  int age{};
  bool active{};
  std::optional<std::string> email;
  std::vector<std::string> roles;

  template <class F>
  void for_each_field(F&& fun) const {
    fun("name", name);
    fun("age", age);
    fun("active", active);
    fun("email", email);
    fun("roles", roles);
  }

  template <class F>
  void for_each_field(F&& fun) {
    fun("name", name);
    fun("age", age);
    fun("active", active);
    fun("email", email);
    fun("roles", roles);
  }
};

}  // namespace

TEST(JsonConvertTest, FieldEnumerableToObject) {
  Person person{"John", 30, true, std::nullopt, {"admin", "user"}};
  EXPECT_EQ(ToJson(ToJsonValue(person)),
            R"({"name":"John","age":30,"active":true,"email":null,"roles":["admin","user"]})");
}

TEST(JsonConvertTest, MapToObject) {
  std::map<std::string, int> counts{{"a", 1}, {"b", 2}};
  EXPECT_EQ(ToJson(ToJsonValue(counts)), R"({"a":1,"b":2})");
}

TEST(JsonConvertTest, ObjectToFieldEnumerable) {
  JsonObject obj{{"name", "Oliver"}, {"age", 28}, {"email", "o@x.io"}, {"roles", JsonArray{"editor"}}};
  Person person;
  FromJsonValue(JsonValue(obj), person);
  EXPECT_EQ(person.name, "Oliver");
  EXPECT_EQ(person.age, 28);
  EXPECT_FALSE(person.active);
  EXPECT_EQ(person.email, "o@x.io");
  EXPECT_EQ(person.roles, std::vector<std::string>{"editor"});
}

TEST(JsonConvertTest, StringsAreCoerced) {
  JsonObject obj{{"age", "41"}, {"active", "TRUE"}};
  Person person;
  FromJsonValue(JsonValue(obj), person);
  EXPECT_EQ(person.age, 41);
  EXPECT_TRUE(person.active);

  double price{};
  FromJsonValue(JsonValue("19.99"), price);
  EXPECT_DOUBLE_EQ(price, 19.99);
}

TEST(JsonConvertTest, MissingAndNullFieldsAreUntouched) {
  Person person;
  person.name = "keep";
  FromJsonValue(JsonValue(JsonObject{{"name", nullptr}}), person);
  EXPECT_EQ(person.name, "keep");
}

TEST(JsonConvertTest, ErrorsNameTheField) {
  Person person;
  try {
    FromJsonValue(JsonValue(JsonObject{{"age", "old"}}), person);
    FAIL() << "expected an exception";
  } catch (const invalid_argument& ex) {
    EXPECT_STREQ(ex.what(), "field 'age': 'old' is not a valid integer");
  }
  EXPECT_THROW(FromJsonValue(JsonValue(JsonArray{}), person), invalid_argument);
  uint8_t small{};
  EXPECT_THROW(FromJsonValue(JsonValue(300), small), invalid_argument);
}

TEST(JsonBuilderTest, MakeJsonObject) {
  auto obj = MakeJsonObject("id", 42, "name", "John", "roles", std::vector<std::string>{"admin"});
  EXPECT_EQ(ToJson(obj), R"({"id":42,"name":"John","roles":["admin"]})");
  EXPECT_TRUE(MakeJsonObject().empty());
}

TEST(JsonBuilderTest, MakeJsonObjectRejectsBadArguments) {
  try {
    (void)MakeJsonObject("id", 42, "name");
    FAIL() << "expected an exception";
  } catch (const invalid_argument& ex) {
    EXPECT_STREQ(ex.what(), "Must provide an even number of arguments");
  }
  try {
    (void)MakeJsonObject(1, 42);
    FAIL() << "expected an exception";
  } catch (const invalid_argument& ex) {
    EXPECT_STREQ(ex.what(), "Keys must be strings");
  }
}

TEST(JsonBuilderTest, MakeJsonArray) {
  EXPECT_EQ(ToJson(MakeJsonArray(1, "two", 3.5, nullptr, std::string_view("five"))), R"([1,"two",3.5,null,"five"])");
}

}  // namespace jazzy
