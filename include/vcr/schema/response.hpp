#pragma once
#include <vcr/schema/body.hpp>
#include <vcr/schema/primitives.hpp>
#include <vcr/schema/status.hpp>
#include <string>

// Schema type: recorded response.
namespace vcr::schema {

template <uint16_t Version>
struct response;

template <>
struct response<1> final {
  response_body_t body{};
  std::string http_version;
  status_t status;
  headers_t headers;

  bool operator==(const response&) const = default;
};

using response_t = response<1>;

}  // namespace vcr::schema
