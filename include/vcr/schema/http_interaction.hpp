#pragma once
#include <vcr/schema/request.hpp>
#include <vcr/schema/response.hpp>
#include <string>

// Schema type: HTTP interaction.
// Cassette format: one request/response pair. `recorded_at` is kept as the
// recorder wrote it; see http_date.hpp to interpret it.
namespace vcr::schema {

template <uint16_t Version>
struct http_interaction;

template <>
struct http_interaction<1> final {
  request_t request;
  response_t response;
  std::string recorded_at;

  bool operator==(const http_interaction&) const = default;
};

using http_interaction_t = http_interaction<1>;

}  // namespace vcr::schema
