#include "product-controller.hpp"

#include <string>

#include "controller-utils.hpp"
#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-builder.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/response-factory.hpp"
#include "jazzy/router.hpp"
#include "jazzy/validation-result.hpp"
#include "rules.hpp"

namespace jazzy::examples {

HttpResponse ProductController::GetProduct(const HttpRequest& request) {
  return ResponseFactory::Json("id", request.path("id", ""), "name", "Premium Headphones", "description",
                               "Noise-canceling wireless headphones", "price", 199.99, "inStock", true);
}

HttpResponse ProductController::ListProducts(const HttpRequest& request) {
  const int page = request.queryInt("page", 1);
  const int limit = request.queryInt("limit", 10);

  JsonObject filters;
  filters.add("category", request.query("category", "all"));
  filters.add("inStock", request.queryBoolean("in_stock", false));

  return ResponseFactory::Json(
      "products",
      MakeJsonArray(MakeJsonObject("id", "prod-1", "name", "Wireless Earbuds", "price", 89.99),
                    MakeJsonObject("id", "prod-2", "name", "Smart Watch", "price", 249.99),
                    MakeJsonObject("id", "prod-3", "name", "Bluetooth Speaker", "price", 129.99)),
      "total", 3, "page", page, "limit", limit, "filters", filters);
}

HttpResponse ProductController::CreateProduct(const HttpRequest& request) {
  ValidationResult result = request.validator()
                                .field("name")
                                .required()
                                .minLength(3)
                                .maxLength(100)
                                .field("description")
                                .required()
                                .minLength(10)
                                .field("price")
                                .required()
                                .numeric()
                                .min(0.01)
                                .field("category")
                                .required()
                                .in("electronics", "clothing", "books", "home", "sports")
                                .field("sku")
                                .required()
                                .pattern(kSkuPattern, std::string(kSkuMessage))
                                .validate();
  if (result.failed()) {
    return ValidationFailed(result);
  }

  JsonObject productData = request.parseJson();
  productData.add("id", NewId("prod-"));
  return ResponseFactory::Success("Product created successfully", productData).status(http::StatusCodeCreated);
}

HttpResponse ProductController::UpdateProduct(const HttpRequest& request) {
  ValidationResult result = request.validator()
                                .field("name")
                                .minLength(3)
                                .maxLength(100)
                                .field("description")
                                .minLength(10)
                                .field("price")
                                .numeric()
                                .min(0.01)
                                .field("category")
                                .in("electronics", "clothing", "books", "home", "sports")
                                .field("sku")
                                .pattern(kSkuPattern, std::string(kSkuMessage))
                                .validate();
  if (result.failed()) {
    return ValidationFailed(result);
  }

  JsonObject productData = request.parseJson();
  productData.add("id", request.path("id", ""));
  return ResponseFactory::Success("Product updated successfully", productData);
}

HttpResponse ProductController::DeleteProduct(const HttpRequest& request) {
  return ResponseFactory::Success("Product deleted successfully", MakeJsonObject("id", request.path("id", "")));
}

HttpResponse ProductController::CreateProductWithRules(const HttpRequest& request) {
  ValidationResult result = request.validate(ProductCreateRules{});
  if (result.failed()) {
    return ValidationFailed(result);
  }

  JsonObject productData = request.parseJson();
  productData.add("id", NewId("prod-"));
  return ResponseFactory::Success("Product created successfully", productData).status(http::StatusCodeCreated);
}

void ProductController::RegisterRoutes(Router& router) {
  router.addRoute(http::Method::GET, "/products/{id}", GetProduct, "ProductController.getProduct");
  router.addRoute(http::Method::GET, "/products", ListProducts, "ProductController.listProducts");
  router.addRoute(http::Method::POST, "/products", CreateProduct, "ProductController.createProduct");
  router.addRoute(http::Method::PUT, "/products/{id}", UpdateProduct, "ProductController.updateProduct");
  router.addRoute(http::Method::DELETE, "/products/{id}", DeleteProduct, "ProductController.deleteProduct");
  router.addRoute(http::Method::POST, "/products/with-rules", CreateProductWithRules,
                  "ProductController.createProductWithRules");
}

}  // namespace jazzy::examples
