#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: HTTP method.
// Cassette format: requests store the verb verbatim (usually lower case).
// This classification is a read-only view over that text.
namespace vcr::schema {

enum class http_method : uint8_t {
  connect = 0,
  delete_ = 1,
  get = 2,
  head = 3,
  options = 4,
  patch = 5,
  post = 6,
  put = 7,
  trace = 8,
};

std::optional<http_method> try_parse_http_method(const std::string_view text);

// Upper-case wire name, eg "GET".
std::string_view to_string(const http_method method);

}  // namespace vcr::schema
