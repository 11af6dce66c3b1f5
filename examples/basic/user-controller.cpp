#include "user-controller.hpp"

#include <string>

#include "controller-utils.hpp"
#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-builder.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/log.hpp"
#include "jazzy/response-factory.hpp"
#include "jazzy/router.hpp"
#include "jazzy/validation-result.hpp"
#include "rules.hpp"

namespace jazzy::examples {

HttpResponse UserController::GetUserById(const HttpRequest& request) {
  return ResponseFactory::Json("id", request.path("id", ""), "name", "John Doe", "email", "john@example.com", "role",
                               "user", "created_at", "2023-01-15");
}

HttpResponse UserController::GetAllUsers(const HttpRequest& request) {
  const int page = request.queryInt("page", 1);
  const int limit = request.queryInt("limit", 10);
  const auto sortBy = request.query("sort_by", "name");
  const auto sortOrder = request.query("sort_order", "asc");

  log::info("Fetching users with page: {}, limit: {}", page, limit);
  log::info("Sorting by: {} {}", sortBy, sortOrder);

  return ResponseFactory::Json(
      "users",
      MakeJsonArray(
          MakeJsonObject("id", "user-1", "name", "John Doe", "email", "john@example.com", "role", "admin"),
          MakeJsonObject("id", "user-2", "name", "Jane Smith", "email", "jane@example.com", "role", "user"),
          MakeJsonObject("id", "user-3", "name", "Mike Johnson", "email", "mike@example.com", "role", "user")),
      "total", 3, "page", page, "limit", limit, "sort", MakeJsonObject("by", sortBy, "order", sortOrder));
}

HttpResponse UserController::CreateUser(const HttpRequest& request) {
  ValidationResult result = request.validator()
                                .field("name")
                                .required()
                                .minLength(3)
                                .maxLength(50)
                                .field("email")
                                .required()
                                .email()
                                .field("password")
                                .required()
                                .minLength(8)
                                .pattern(kPasswordPattern, std::string(kPasswordMessage))
                                .field("role")
                                .in("admin", "user", "editor")
                                .validate();
  if (result.failed()) {
    return ValidationFailed(result);
  }

  JsonObject userData = request.parseJson();
  userData.erase("password");
  userData.add("id", NewId("user-"));
  userData.add("created_at", "2023-05-20");
  return ResponseFactory::Success("User created successfully", userData).status(http::StatusCodeCreated);
}

HttpResponse UserController::UpdateUser(const HttpRequest& request) {
  // Fields are optional for updates.
  ValidationResult result = request.validator()
                                .field("name")
                                .minLength(3)
                                .maxLength(50)
                                .field("email")
                                .email()
                                .field("password")
                                .minLength(8)
                                .pattern(kPasswordPattern, std::string(kPasswordMessage))
                                .field("role")
                                .in("admin", "user", "editor")
                                .validate();
  if (result.failed()) {
    return ValidationFailed(result);
  }

  JsonObject userData = request.parseJson();
  userData.erase("password");
  userData.add("id", request.path("id", ""));
  userData.add("updated_at", "2023-05-20");
  return ResponseFactory::Success("User updated successfully", userData);
}

HttpResponse UserController::DeleteUser(const HttpRequest& request) {
  return ResponseFactory::Success("User deleted successfully", MakeJsonObject("id", request.path("id", "")));
}

HttpResponse UserController::CreateUserWithRules(const HttpRequest& request) {
  ValidationResult result = request.validate(UserCreateRules{});
  if (result.failed()) {
    return ValidationFailed(result);
  }

  JsonObject userData = request.parseJson();
  userData.erase("password");
  userData.add("id", NewId("user-"));
  userData.add("created_at", "2023-05-20");
  return ResponseFactory::Success("User created successfully", userData).status(http::StatusCodeCreated);
}

void UserController::RegisterRoutes(Router& router) {
  router.addRoute(http::Method::GET, "/users/{id}", GetUserById, "UserController.getUserById");
  router.addRoute(http::Method::GET, "/users", GetAllUsers, "UserController.getAllUsers");
  router.addRoute(http::Method::POST, "/users", CreateUser, "UserController.createUser");
  router.addRoute(http::Method::PUT, "/users/{id}", UpdateUser, "UserController.updateUser");
  router.addRoute(http::Method::DELETE, "/users/{id}", DeleteUser, "UserController.deleteUser");
  router.addRoute(http::Method::POST, "/users/with-rules", CreateUserWithRules, "UserController.createUserWithRules");
}

}  // namespace jazzy::examples
