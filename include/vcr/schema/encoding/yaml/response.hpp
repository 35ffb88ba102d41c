#pragma once
#include <vcr/schema/response.hpp>
#include <vcr/schema/encoding/yaml/decode_context.hpp>
#include <yaml-cpp/yaml.h>

namespace vcr::schema::encoding::yaml {

void encode(const vcr::schema::response_t& o, ::YAML::Node& node);
void decode(vcr::schema::response_t& o,
            const ::YAML::Node& node,
            const decode_context& context);

}  // namespace vcr::schema::encoding::yaml
