#pragma once
#include <cstdint>
#include <string>

// Schema type: response status.
// Cassette format: {code, message}; any integer code and any message text are
// accepted.
namespace vcr::schema {

template <uint16_t Version>
struct status;

template <>
struct status<1> final {
  int64_t code{};
  std::string message;

  bool operator==(const status&) const = default;
};

using status_t = status<1>;

}  // namespace vcr::schema
