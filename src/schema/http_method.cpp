#include <vcr/schema/enum_string.hpp>
#include <vcr/schema/http_method.hpp>

namespace vcr::schema {

namespace {

constexpr auto kMethodNames = enum_mappings_t<http_method, 9>{{
    {"connect", http_method::connect},
    {"delete", http_method::delete_},
    {"get", http_method::get},
    {"head", http_method::head},
    {"options", http_method::options},
    {"patch", http_method::patch},
    {"post", http_method::post},
    {"put", http_method::put},
    {"trace", http_method::trace},
}};

constexpr auto kWireNames = enum_mappings_t<http_method, 9>{{
    {"CONNECT", http_method::connect},
    {"DELETE", http_method::delete_},
    {"GET", http_method::get},
    {"HEAD", http_method::head},
    {"OPTIONS", http_method::options},
    {"PATCH", http_method::patch},
    {"POST", http_method::post},
    {"PUT", http_method::put},
    {"TRACE", http_method::trace},
}};

}  // namespace

std::optional<http_method> try_parse_http_method(const std::string_view text) {
  return from_string_icase(text, kMethodNames);
}

std::string_view to_string(const http_method method) {
  return to_string(method, kWireNames).value_or(std::string_view{});
}

}  // namespace vcr::schema
