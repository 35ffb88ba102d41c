#include <vcr/schema/encoding/yaml/http_interaction.hpp>
#include <vcr/schema/encoding/yaml/primitives.hpp>
#include <vcr/schema/encoding/yaml/request.hpp>
#include <vcr/schema/encoding/yaml/response.hpp>

using namespace vcr::schema;

namespace vcr::schema::encoding::yaml {

void encode(const http_interaction_t& o, ::YAML::Node& node) {
  node = ::YAML::Node{::YAML::NodeType::Map};
  auto request = ::YAML::Node{};
  encode(o.request, request);
  node["request"] = request;
  auto response = ::YAML::Node{};
  encode(o.response, response);
  node["response"] = response;
  node["recorded_at"] = make_string_node(o.recorded_at);
}

void decode(http_interaction_t& o,
            const ::YAML::Node& node,
            const decode_context& context) {
  expect_map(node, context);
  auto request = required_field(node, "request", context);
  decode(o.request, request.node, request.context);
  auto response = required_field(node, "response", context);
  decode(o.response, response.node, response.context);
  auto recorded_at = required_field(node, "recorded_at", context);
  decode(o.recorded_at, recorded_at.node, recorded_at.context);
}

}  // namespace vcr::schema::encoding::yaml
