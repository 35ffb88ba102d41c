#include <vcr/matching/pattern.hpp>
#include <vcr/schema/encoding/yaml/decode_context.hpp>
#include <vcr/schema/primitives.hpp>
#include <vcr/schema/validate.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace vcr::schema {

namespace {

using encoding::yaml::decode_context;

void validate_text(const std::string_view text, const decode_context& context) {
  if (!is_valid_utf8(text)) {
    context.fail("string is not valid UTF-8");
  }
}

void validate_json(const json_value_t& value, const decode_context& context) {
  if (value.IsScalar()) {
    validate_text(value.Scalar(), context);
  } else if (value.IsSequence()) {
    for (std::size_t i = 0; i < value.size(); ++i) {
      validate_json(value[i], context.element(i));
    }
  } else if (value.IsMap()) {
    for (const auto& entry : value) {
      const auto& key = entry.first.Scalar();
      validate_text(key, context);
      validate_json(entry.second, context.field(key));
    }
  }
}

void validate_headers(const headers_t& headers, const decode_context& context) {
  for (const auto& [name, values] : headers) {
    validate_text(name, context);
    auto field = context.field(name);
    for (std::size_t i = 0; i < values.size(); ++i) {
      validate_text(values[i], field.element(i));
    }
  }
  for (auto it = std::begin(headers); it != std::end(headers); ++it) {
    auto duplicate = std::find_if(
        std::next(it), std::end(headers),
        [&](const header_entry_t& entry) { return entry.first == it->first; });
    if (duplicate != std::end(headers)) {
      context.field(it->first).fail("duplicate header");
    }
  }
}

void validate_matcher(const body_matcher_t& matcher,
                      const decode_context& context) {
  std::visit(overloaded{[&](const substring_matcher_t& m) {
                          validate_text(m.needle, context.field("substring"));
                        },
                        [&](const regex_matcher_t& m) {
                          auto field = context.field("regex");
                          validate_text(m.pattern, field);
                          if (!context.caps.regex) {
                            field.fail("unsupported matcher 'regex'");
                          }
                          if (!vcr::matching::try_compile_pattern(m.pattern)) {
                            field.fail("invalid regular expression");
                          }
                        }},
             matcher);
}

void validate_encoded(const encoded_body_t& body,
                      const decode_context& context) {
  if (body.encoding) {
    validate_text(*body.encoding, context.field("encoding"));
  }
  validate_text(body.string, context.field("string"));
}

void validate_response_body(const response_body_t& body,
                            const decode_context& context) {
  std::visit(
      overloaded{
          [&](const plain_body_t& b) { validate_text(b.text, context); },
          [&](const encoded_body_t& b) { validate_encoded(b, context); }},
      body);
}

void validate_body(const body_t& body, const decode_context& context) {
  std::visit(
      overloaded{
          [&](const plain_body_t& b) { validate_text(b.text, context); },
          [&](const encoded_body_t& b) { validate_encoded(b, context); },
          [&](const json_body_t& b) {
            if (!context.caps.json) {
              context.fail("unsupported body: json bodies are disabled");
            }
            validate_json(b.value, context.field("json"));
          },
          [&](const match_list_body_t& b) {
            if (!context.caps.matching) {
              context.fail("unsupported body: match lists are disabled");
            }
            auto matches = context.field("matches");
            for (std::size_t i = 0; i < b.matchers.size(); ++i) {
              validate_matcher(b.matchers[i], matches.element(i));
            }
          }},
      body);
}

}  // namespace

void validate(const cassette_t& cassette, const capabilities& caps) {
  auto root = decode_context{.caps = caps, .path = {}};
  validate_text(cassette.recorded_with, root.field("recorded_with"));
  auto interactions = root.field("http_interactions");
  for (std::size_t i = 0; i < cassette.http_interactions.size(); ++i) {
    const auto& interaction = cassette.http_interactions[i];
    auto context = interactions.element(i);
    validate_text(interaction.recorded_at, context.field("recorded_at"));

    auto request = context.field("request");
    validate_text(interaction.request.method, request.field("method"));
    validate_text(interaction.request.uri, request.field("uri"));
    validate_body(interaction.request.body, request.field("body"));
    validate_headers(interaction.request.headers, request.field("headers"));

    auto response = context.field("response");
    validate_text(interaction.response.status.message,
                  response.field("status").field("message"));
    validate_text(interaction.response.http_version,
                  response.field("http_version"));
    validate_response_body(interaction.response.body, response.field("body"));
    validate_headers(interaction.response.headers, response.field("headers"));
  }
}

}  // namespace vcr::schema
