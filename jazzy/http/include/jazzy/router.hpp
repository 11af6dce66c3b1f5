#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jazzy/handler-result.hpp"
#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"

namespace jazzy {

using RequestHandler = std::function<HandlerResult(const HttpRequest&)>;

// A registered route. Immutable once registered.
class Route {
 public:
  Route(http::Method method, std::string pattern, RequestHandler handler, std::string handlerName);

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  [[nodiscard]] std::string_view handlerName() const noexcept { return _handlerName; }

  [[nodiscard]] const RequestHandler& handler() const noexcept { return _handler; }

  // Whether the whole of path fits the pattern, each {name} segment matching one non empty path segment.
  [[nodiscard]] bool matches(std::string_view path) const noexcept;

 private:
  friend class Router;

  // Pattern split into literal text and parameter placeholders. A parameter matches [^/]+.
  struct Token {
    enum class Kind : std::uint8_t { Literal, Param };

    Kind kind;
    std::string text;
  };

  static std::vector<Token> Compile(std::string_view pattern);

  [[nodiscard]] bool matchFrom(std::size_t tokenPos, std::string_view path) const noexcept;

  http::Method _method;
  std::string _pattern;
  std::string _handlerName;
  RequestHandler _handler;
  std::vector<Token> _tokens;
};

// Route table. Routes are kept in registration order and matching returns the first registered route that fits,
// without any specificity ranking.
// Registration happens before the server starts, the table is only read afterwards.
class Router {
 public:
  // Registers handler for (method, pattern). A route already registered with the same method and the same pattern
  // text is replaced in place (keeping its precedence).
  // Pattern segments written {name} capture one path segment. Unbalanced braces are literal text.
  // handlerName defaults to "<METHOD> <pattern>" and is used in logs.
  void addRoute(http::Method method, std::string pattern, RequestHandler handler, std::string handlerName = {});

  // Same as above with the method given as a string (case insensitive).
  // Throws jazzy::invalid_argument if the method is not supported.
  void addRoute(std::string_view method, std::string pattern, RequestHandler handler, std::string handlerName = {});

  void get(std::string pattern, RequestHandler handler) {
    addRoute(http::Method::GET, std::move(pattern), std::move(handler));
  }

  void post(std::string pattern, RequestHandler handler) {
    addRoute(http::Method::POST, std::move(pattern), std::move(handler));
  }

  void put(std::string pattern, RequestHandler handler) {
    addRoute(http::Method::PUT, std::move(pattern), std::move(handler));
  }

  void patch(std::string pattern, RequestHandler handler) {
    addRoute(http::Method::PATCH, std::move(pattern), std::move(handler));
  }

  void del(std::string pattern, RequestHandler handler) {
    addRoute(http::Method::DELETE, std::move(pattern), std::move(handler));
  }

  // First route registered for method whose pattern fits path, nullptr if none.
  [[nodiscard]] const Route* match(http::Method method, std::string_view path) const noexcept;

  // Same as above, nullptr if the method is not supported.
  [[nodiscard]] const Route* match(std::string_view method, std::string_view path) const noexcept;

  // Pairs the {name} segments of pattern with the segments at the same position in path.
  // Expects path to match pattern, extra segments on either side are ignored.
  [[nodiscard]] static StringMap ExtractPathParams(std::string_view pattern, std::string_view path);

  [[nodiscard]] static bool IsSupportedMethod(std::string_view method) noexcept {
    return http::MethodStrToOptEnum(method).has_value();
  }

  [[nodiscard]] const std::vector<Route>& routes() const noexcept { return _routes; }

  [[nodiscard]] std::size_t size() const noexcept { return _routes.size(); }

  [[nodiscard]] bool empty() const noexcept { return _routes.empty(); }

 private:
  std::vector<Route> _routes;
};

}  // namespace jazzy
