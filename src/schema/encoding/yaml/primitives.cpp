#include <vcr/schema/encoding/yaml/primitives.hpp>
#include <vcr/schema/json_value.hpp>

#include <algorithm>
#include <charconv>

namespace vcr::schema::encoding::yaml {

void expect_map(const ::YAML::Node& node, const decode_context& context) {
  if (!node.IsMap()) {
    context.fail("expected a mapping");
  }
}

void expect_only_fields(const ::YAML::Node& node,
                        std::initializer_list<std::string_view> names,
                        const decode_context& context) {
  for (const auto& entry : node) {
    const auto& key = entry.first.Scalar();
    if (std::ranges::find(names, std::string_view{key}) == std::end(names)) {
      context.fail("unexpected field '" + key + "'");
    }
  }
}

field_t required_field(const ::YAML::Node& node,
                       const std::string_view name,
                       const decode_context& context) {
  auto field = optional_field(node, name, context);
  if (!field) {
    context.field(name).fail("missing required field");
  }
  return *std::move(field);
}

std::optional<field_t> optional_field(const ::YAML::Node& node,
                                      const std::string_view name,
                                      const decode_context& context) {
  expect_map(node, context);
  auto child = node[std::string{name}];
  if (!child || child.IsNull()) {
    return std::nullopt;
  }
  return field_t{.node = child, .context = context.field(name)};
}

::YAML::Node make_string_node(const std::string_view text) {
  return vcr::schema::make_json_string(text);
}

void encode(const std::string& o, ::YAML::Node& node) {
  node = make_string_node(o);
}

void decode(std::string& o,
            const ::YAML::Node& node,
            const decode_context& context) {
  if (!node.IsScalar()) {
    context.fail("expected a string");
  }
  o = node.Scalar();
}

void encode(const int64_t& o, ::YAML::Node& node) {
  node = o;
}

void decode(int64_t& o, const ::YAML::Node& node, const decode_context& context) {
  if (!node.IsScalar() ||
      vcr::schema::kind_of(node) != vcr::schema::json_kind::number) {
    context.fail("expected an integer");
  }
  const auto& text = node.Scalar();
  auto begin = text.data();
  if (!text.empty() && text.front() == '+') {
    ++begin;
  }
  auto [ptr, ec] = std::from_chars(begin, text.data() + text.size(), o);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    context.fail("expected an integer");
  }
}

void encode(const vcr::schema::headers_t& o, ::YAML::Node& node) {
  node = ::YAML::Node{::YAML::NodeType::Map};
  for (const auto& [name, values] : o) {
    auto sequence = ::YAML::Node{::YAML::NodeType::Sequence};
    for (const auto& value : values) {
      sequence.push_back(make_string_node(value));
    }
    node[name] = sequence;
  }
}

void decode(vcr::schema::headers_t& o,
            const ::YAML::Node& node,
            const decode_context& context) {
  o.clear();
  if (!node || node.IsNull()) {
    return;
  }
  if (!node.IsMap()) {
    context.fail("expected a mapping of header names to value lists");
  }
  for (const auto& entry : node) {
    if (!entry.first.IsScalar()) {
      context.fail("header names must be strings");
    }
    const auto& name = entry.first.Scalar();
    auto header_context = context.field(name);
    if (vcr::schema::find_header(o, name) != nullptr) {
      header_context.fail("duplicate header");
    }
    if (!entry.second.IsSequence()) {
      header_context.fail("expected a sequence of header values");
    }
    auto values = vcr::schema::header_values_t{};
    values.reserve(entry.second.size());
    for (std::size_t i = 0; i < entry.second.size(); ++i) {
      auto value = std::string{};
      decode(value, entry.second[i], header_context.element(i));
      values.push_back(std::move(value));
    }
    o.emplace_back(name, std::move(values));
  }
}

}  // namespace vcr::schema::encoding::yaml
