#include <vcr/matching/pattern.hpp>
#include <vcr/schema/encoding/yaml/body.hpp>
#include <vcr/schema/encoding/yaml/primitives.hpp>

using namespace vcr::schema;

namespace vcr::schema::encoding::yaml {

namespace {

void encode_encoded(const encoded_body_t& o, ::YAML::Node& node) {
  node = ::YAML::Node{::YAML::NodeType::Map};
  if (o.encoding) {
    node["encoding"] = make_string_node(*o.encoding);
  } else {
    node["encoding"] = ::YAML::Node{::YAML::NodeType::Null};
  }
  node["string"] = make_string_node(o.string);
}

encoded_body_t decode_encoded(const ::YAML::Node& node,
                              const decode_context& context) {
  expect_only_fields(node, {"encoding", "string"}, context);
  if (!node["encoding"]) {
    context.field("encoding").fail("missing required field");
  }
  auto body = encoded_body_t{};
  if (auto encoding = optional_field(node, "encoding", context)) {
    auto value = std::string{};
    decode(value, encoding->node, encoding->context);
    body.encoding = std::move(value);
  }
  auto string = required_field(node, "string", context);
  decode(body.string, string.node, string.context);
  return body;
}

bool is_encoded_shape(const ::YAML::Node& node) {
  return static_cast<bool>(node["encoding"]) ||
         static_cast<bool>(node["string"]);
}

}  // namespace

void encode(const body_t& o, ::YAML::Node& node) {
  std::visit(
      overloaded{
          [&](const plain_body_t& body) { node = make_string_node(body.text); },
          [&](const encoded_body_t& body) { encode_encoded(body, node); },
          [&](const json_body_t& body) {
            node = ::YAML::Node{::YAML::NodeType::Map};
            node["json"] = ::YAML::Clone(body.value);
          },
          [&](const match_list_body_t& body) {
            auto matchers = ::YAML::Node{::YAML::NodeType::Sequence};
            for (const auto& matcher : body.matchers) {
              auto child = ::YAML::Node{};
              encode(matcher, child);
              matchers.push_back(child);
            }
            node = ::YAML::Node{::YAML::NodeType::Map};
            node["matches"] = matchers;
          }},
      o);
}

void decode(body_t& o, const ::YAML::Node& node, const decode_context& context) {
  if (!node || node.IsNull()) {
    o = plain_body_t{};
    return;
  }
  if (node.IsScalar()) {
    o = plain_body_t{.text = node.Scalar()};
    return;
  }
  if (!node.IsMap()) {
    context.fail("expected a string or a mapping");
  }

  if (node["json"]) {
    if (!context.caps.json) {
      context.fail("unsupported body: json bodies are disabled");
    }
    expect_only_fields(node, {"json"}, context);
    o = json_body_t{.value = ::YAML::Clone(node["json"])};
    return;
  }

  if (node["matches"]) {
    if (!context.caps.matching) {
      context.fail("unsupported body: match lists are disabled");
    }
    expect_only_fields(node, {"matches"}, context);
    auto matches_context = context.field("matches");
    const auto matches = node["matches"];
    if (!matches.IsSequence()) {
      matches_context.fail("expected a sequence of matchers");
    }
    auto body = match_list_body_t{};
    body.matchers.reserve(matches.size());
    for (std::size_t i = 0; i < matches.size(); ++i) {
      auto matcher = body_matcher_t{};
      decode(matcher, matches[i], matches_context.element(i));
      body.matchers.push_back(std::move(matcher));
    }
    o = std::move(body);
    return;
  }

  if (is_encoded_shape(node)) {
    o = decode_encoded(node, context);
    return;
  }

  context.fail("unknown body shape");
}

void encode(const response_body_t& o, ::YAML::Node& node) {
  std::visit(
      overloaded{
          [&](const plain_body_t& body) { node = make_string_node(body.text); },
          [&](const encoded_body_t& body) { encode_encoded(body, node); }},
      o);
}

void decode(response_body_t& o,
            const ::YAML::Node& node,
            const decode_context& context) {
  if (!node || node.IsNull()) {
    o = plain_body_t{};
    return;
  }
  if (node.IsScalar()) {
    o = plain_body_t{.text = node.Scalar()};
    return;
  }
  if (node.IsMap() && is_encoded_shape(node)) {
    o = decode_encoded(node, context);
    return;
  }
  context.fail("response bodies must be strings");
}

void encode(const body_matcher_t& o, ::YAML::Node& node) {
  node = ::YAML::Node{::YAML::NodeType::Map};
  std::visit(overloaded{[&](const substring_matcher_t& matcher) {
                          node["substring"] = make_string_node(matcher.needle);
                        },
                        [&](const regex_matcher_t& matcher) {
                          node["regex"] = make_string_node(matcher.pattern);
                        }},
             o);
}

void decode(body_matcher_t& o,
            const ::YAML::Node& node,
            const decode_context& context) {
  expect_map(node, context);
  if (node.size() != 1) {
    context.fail("a matcher has exactly one of 'substring' or 'regex'");
  }
  auto kind = node.begin()->first.Scalar();
  auto value = std::string{};
  auto field = required_field(node, kind, context);
  if (kind == "substring") {
    decode(value, field.node, field.context);
    o = substring_matcher_t{.needle = std::move(value)};
    return;
  }
  if (kind == "regex") {
    if (!context.caps.regex) {
      field.context.fail("unsupported matcher 'regex'");
    }
    decode(value, field.node, field.context);
    if (!vcr::matching::try_compile_pattern(value)) {
      field.context.fail("invalid regular expression");
    }
    o = regex_matcher_t{.pattern = std::move(value)};
    return;
  }
  field.context.fail("unsupported matcher '" + kind + "'");
}

}  // namespace vcr::schema::encoding::yaml
