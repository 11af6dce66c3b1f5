#include "jazzy/router.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/invalid-argument-exception.hpp"
#include "jazzy/log.hpp"

namespace jazzy {

namespace {

// Calls fun on each '/' separated segment of str, empty segments included.
template <class Fun>
void ForEachSegment(std::string_view str, Fun&& fun) {
  while (true) {
    const auto slashPos = str.find('/');
    if (slashPos == std::string_view::npos) {
      fun(str);
      return;
    }
    fun(str.substr(0, slashPos));
    str.remove_prefix(slashPos + 1);
  }
}

std::vector<std::string_view> SplitSegments(std::string_view str) {
  std::vector<std::string_view> segments;
  ForEachSegment(str, [&segments](std::string_view segment) { segments.push_back(segment); });
  return segments;
}

}  // namespace

Route::Route(http::Method method, std::string pattern, RequestHandler handler, std::string handlerName)
    : _method(method),
      _pattern(std::move(pattern)),
      _handlerName(std::move(handlerName)),
      _handler(std::move(handler)),
      _tokens(Compile(_pattern)) {}

std::vector<Route::Token> Route::Compile(std::string_view pattern) {
  std::vector<Token> tokens;
  auto appendLiteral = [&tokens](std::string_view text) {
    if (text.empty()) {
      return;
    }
    if (!tokens.empty() && tokens.back().kind == Token::Kind::Literal) {
      tokens.back().text.append(text);
    } else {
      tokens.push_back(Token{Token::Kind::Literal, std::string(text)});
    }
  };

  bool firstSegment = true;
  ForEachSegment(pattern, [&](std::string_view segment) {
    if (!firstSegment) {
      appendLiteral("/");
    }
    firstSegment = false;

    // A placeholder spans from the first '{' to the last '}' of the segment, with at least one char in between.
    const auto openPos = segment.find('{');
    const auto closePos = segment.rfind('}');
    if (openPos == std::string_view::npos || closePos == std::string_view::npos || closePos <= openPos + 1) {
      appendLiteral(segment);
      return;
    }
    appendLiteral(segment.substr(0, openPos));
    tokens.push_back(Token{Token::Kind::Param, std::string(segment.substr(openPos + 1, closePos - openPos - 1))});
    appendLiteral(segment.substr(closePos + 1));
  });
  return tokens;
}

bool Route::matches(std::string_view path) const noexcept { return matchFrom(0, path); }

bool Route::matchFrom(std::size_t tokenPos, std::string_view path) const noexcept {
  if (tokenPos == _tokens.size()) {
    return path.empty();
  }
  const Token& token = _tokens[tokenPos];
  if (token.kind == Token::Kind::Literal) {
    return path.starts_with(token.text) && matchFrom(tokenPos + 1, path.substr(token.text.size()));
  }
  const auto maxLen = std::min(path.find('/'), path.size());
  for (std::size_t len = maxLen; len > 0; --len) {
    if (matchFrom(tokenPos + 1, path.substr(len))) {
      return true;
    }
  }
  return false;
}

void Router::addRoute(http::Method method, std::string pattern, RequestHandler handler, std::string handlerName) {
  if (handlerName.empty()) {
    handlerName.append(http::MethodToStr(method)).push_back(' ');
    handlerName.append(pattern);
  }
  auto it = std::ranges::find_if(
      _routes, [method, &pattern](const Route& route) { return route.method() == method && route.pattern() == pattern; });
  if (it != _routes.end()) {
    log::debug("Replacing handler of route {} {}", http::MethodToStr(method), pattern);
    *it = Route(method, std::move(pattern), std::move(handler), std::move(handlerName));
    return;
  }
  log::debug("Registering route {} {} -> {}", http::MethodToStr(method), pattern, handlerName);
  _routes.emplace_back(method, std::move(pattern), std::move(handler), std::move(handlerName));
}

void Router::addRoute(std::string_view method, std::string pattern, RequestHandler handler, std::string handlerName) {
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (!optMethod) {
    throw invalid_argument("Unsupported HTTP method: {}", method);
  }
  addRoute(*optMethod, std::move(pattern), std::move(handler), std::move(handlerName));
}

const Route* Router::match(http::Method method, std::string_view path) const noexcept {
  for (const Route& route : _routes) {
    if (route.method() == method && route.matches(path)) {
      return &route;
    }
  }
  return nullptr;
}

const Route* Router::match(std::string_view method, std::string_view path) const noexcept {
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (!optMethod) {
    return nullptr;
  }
  return match(*optMethod, path);
}

StringMap Router::ExtractPathParams(std::string_view pattern, std::string_view path) {
  StringMap params;
  const auto patternSegments = SplitSegments(pattern);
  const auto pathSegments = SplitSegments(path);
  const auto nbSegments = std::min(patternSegments.size(), pathSegments.size());
  for (std::size_t segmentPos = 0; segmentPos < nbSegments; ++segmentPos) {
    std::string_view segment = patternSegments[segmentPos];
    if (segment.size() >= 2 && segment.front() == '{' && segment.back() == '}') {
      params.insert_or_assign(std::string(segment.substr(1, segment.size() - 2)),
                              std::string(pathSegments[segmentPos]));
    }
  }
  return params;
}

}  // namespace jazzy
