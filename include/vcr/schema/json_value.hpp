#pragma once
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <string_view>

// Structured JSON values are held as yaml-cpp document nodes. YAML is a
// superset of JSON, so the same tree represents values read from either
// syntax.
namespace vcr::schema {

using json_value_t = ::YAML::Node;

enum class json_kind : uint8_t {
  null = 0,
  boolean = 1,
  number = 2,
  string = 3,
  array = 4,
  object = 5,
};

/// Resolve the JSON type of a node.
///
/// Quoted scalars (and scalars tagged `!!str`) are strings. Plain scalars
/// resolve with the YAML 1.2 core schema: null, booleans, then numbers, and
/// anything else is a string.
json_kind kind_of(const json_value_t& value);

/// Deep equality: object key order is ignored, array order is significant,
/// scalars compare by resolved kind and numbers compare numerically.
bool structurally_equal(const json_value_t& lhs, const json_value_t& rhs);

/// True when `text` is exactly one JSON value in strict RFC 8259 syntax,
/// optionally surrounded by whitespace.
bool is_json_text(const std::string_view text);

/// A scalar that always resolves to a JSON string, whatever its text.
json_value_t make_json_string(const std::string_view text);

}  // namespace vcr::schema
