#pragma once
#include <vcr/schema/encoding/yaml/decode_context.hpp>
#include <vcr/schema/primitives.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace vcr::schema::encoding::yaml {

struct field_t final {
  ::YAML::Node node;
  decode_context context;
};

void expect_map(const ::YAML::Node& node, const decode_context& context);

void expect_only_fields(const ::YAML::Node& node,
                        std::initializer_list<std::string_view> names,
                        const decode_context& context);

// Fails with "missing required field" when absent or null.
field_t required_field(const ::YAML::Node& node,
                       const std::string_view name,
                       const decode_context& context);

// Absent and null fields are both reported as std::nullopt.
std::optional<field_t> optional_field(const ::YAML::Node& node,
                                      const std::string_view name,
                                      const decode_context& context);

// A scalar node that always reads back as a string.
::YAML::Node make_string_node(const std::string_view text);

void encode(const std::string& o, ::YAML::Node& node);
void decode(std::string& o,
            const ::YAML::Node& node,
            const decode_context& context);

void encode(const int64_t& o, ::YAML::Node& node);
void decode(int64_t& o, const ::YAML::Node& node, const decode_context& context);

void encode(const vcr::schema::headers_t& o, ::YAML::Node& node);
void decode(vcr::schema::headers_t& o,
            const ::YAML::Node& node,
            const decode_context& context);

}  // namespace vcr::schema::encoding::yaml
