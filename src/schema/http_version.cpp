#include <vcr/schema/enum_string.hpp>
#include <vcr/schema/http_version.hpp>

namespace vcr::schema {

namespace {

constexpr auto kVersionNames = enum_mappings_t<http_version, 5>{{
    {"0.9", http_version::http0_9},
    {"1.0", http_version::http1_0},
    {"1.1", http_version::http1_1},
    {"2", http_version::http2},
    {"3", http_version::http3},
}};

}  // namespace

std::optional<http_version> try_parse_http_version(
    const std::string_view text) {
  return from_string(text, kVersionNames);
}

std::string_view to_string(const http_version version) {
  return to_string(version, kVersionNames).value_or(std::string_view{});
}

}  // namespace vcr::schema
