#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: HTTP version.
// Cassette format: responses store `http_version` as text ("1.1"); this is an
// optional typed view.
namespace vcr::schema {

enum class http_version : uint8_t {
  http0_9 = 0,
  http1_0 = 1,
  http1_1 = 2,
  http2 = 3,
  http3 = 4,
};

std::optional<http_version> try_parse_http_version(const std::string_view text);

std::string_view to_string(const http_version version);

}  // namespace vcr::schema
