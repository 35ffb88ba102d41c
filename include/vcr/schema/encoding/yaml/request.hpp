#pragma once
#include <vcr/schema/request.hpp>
#include <vcr/schema/encoding/yaml/decode_context.hpp>
#include <yaml-cpp/yaml.h>

namespace vcr::schema::encoding::yaml {

void encode(const vcr::schema::request_t& o, ::YAML::Node& node);
void decode(vcr::schema::request_t& o,
            const ::YAML::Node& node,
            const decode_context& context);

}  // namespace vcr::schema::encoding::yaml
