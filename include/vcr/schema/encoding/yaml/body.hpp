#pragma once
#include <vcr/schema/body.hpp>
#include <vcr/schema/encoding/yaml/decode_context.hpp>
#include <yaml-cpp/yaml.h>

namespace vcr::schema::encoding::yaml {

void encode(const vcr::schema::body_t& o, ::YAML::Node& node);
void decode(vcr::schema::body_t& o,
            const ::YAML::Node& node,
            const decode_context& context);

void encode(const vcr::schema::response_body_t& o, ::YAML::Node& node);
void decode(vcr::schema::response_body_t& o,
            const ::YAML::Node& node,
            const decode_context& context);

void encode(const vcr::schema::body_matcher_t& o, ::YAML::Node& node);
void decode(vcr::schema::body_matcher_t& o,
            const ::YAML::Node& node,
            const decode_context& context);

}  // namespace vcr::schema::encoding::yaml
