#pragma once

#include "jazzy/http-request.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/router.hpp"

namespace jazzy::examples {

class ProductController {
 public:
  static HttpResponse GetProduct(const HttpRequest& request);
  static HttpResponse ListProducts(const HttpRequest& request);
  static HttpResponse CreateProduct(const HttpRequest& request);
  static HttpResponse UpdateProduct(const HttpRequest& request);
  static HttpResponse DeleteProduct(const HttpRequest& request);
  static HttpResponse CreateProductWithRules(const HttpRequest& request);

  static void RegisterRoutes(Router& router);
};

}  // namespace jazzy::examples
