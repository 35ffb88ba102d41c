#pragma once
#include <vcr/schema/json_value.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema type: recorded HTTP body.
// Cassette format: a bare string, an {encoding, string} pair, a {json: value}
// document or a {matches: [rule]} list. Only the first two appear in
// responses.
namespace vcr::schema {

// Matches only a body equal to `text`, byte for byte.
struct plain_body_t final {
  std::string text;

  bool operator==(const plain_body_t&) const = default;
};

// `encoding` is null when the recorder did not transform the string.
struct encoded_body_t final {
  std::optional<std::string> encoding;
  std::string string;

  bool operator==(const encoded_body_t&) const = default;
};

struct json_body_t final {
  json_value_t value;

  bool operator==(const json_body_t& other) const {
    return structurally_equal(value, other.value);
  }
};

struct substring_matcher_t final {
  std::string needle;

  bool operator==(const substring_matcher_t&) const = default;
};

struct regex_matcher_t final {
  std::string pattern;

  bool operator==(const regex_matcher_t&) const = default;
};

using body_matcher_t = std::variant<substring_matcher_t, regex_matcher_t>;

// Every matcher must pass for a body to match.
struct match_list_body_t final {
  std::vector<body_matcher_t> matchers;

  bool operator==(const match_list_body_t&) const = default;
};

using body_t = std::variant<plain_body_t,
                            encoded_body_t,
                            json_body_t,
                            match_list_body_t>;

using response_body_t = std::variant<plain_body_t, encoded_body_t>;

/// Render a body for logs and diagnostics.
std::string describe(const body_t& body);
std::string describe(const response_body_t& body);
std::string describe(const body_matcher_t& matcher);

}  // namespace vcr::schema
