#pragma once

#include "jazzy/http-request.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/router.hpp"

namespace jazzy::examples {

class UserController {
 public:
  static HttpResponse GetUserById(const HttpRequest& request);
  static HttpResponse GetAllUsers(const HttpRequest& request);
  static HttpResponse CreateUser(const HttpRequest& request);
  static HttpResponse UpdateUser(const HttpRequest& request);
  static HttpResponse DeleteUser(const HttpRequest& request);
  static HttpResponse CreateUserWithRules(const HttpRequest& request);

  static void RegisterRoutes(Router& router);
};

}  // namespace jazzy::examples
