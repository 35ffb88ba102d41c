#pragma once
#include <vcr/schema/body.hpp>
#include <vcr/schema/primitives.hpp>
#include <string>

// Schema type: recorded request.
// Cassette format: the request half of an interaction. `body` may carry
// matchers instead of a literal payload.
namespace vcr::schema {

template <uint16_t Version>
struct request;

template <>
struct request<1> final {
  std::string uri;
  body_t body{};
  std::string method;
  headers_t headers;

  bool operator==(const request&) const = default;
};

using request_t = request<1>;

}  // namespace vcr::schema
