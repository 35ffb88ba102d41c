#include <vcr/schema/encoding/yaml/body.hpp>
#include <vcr/schema/encoding/yaml/primitives.hpp>
#include <vcr/schema/encoding/yaml/response.hpp>
#include <vcr/schema/encoding/yaml/status.hpp>

using namespace vcr::schema;

namespace vcr::schema::encoding::yaml {

void encode(const response_t& o, ::YAML::Node& node) {
  node = ::YAML::Node{::YAML::NodeType::Map};
  auto body = ::YAML::Node{};
  encode(o.body, body);
  node["body"] = body;
  node["http_version"] = make_string_node(o.http_version);
  auto status = ::YAML::Node{};
  encode(o.status, status);
  node["status"] = status;
  auto headers = ::YAML::Node{};
  encode(o.headers, headers);
  node["headers"] = headers;
}

void decode(response_t& o,
            const ::YAML::Node& node,
            const decode_context& context) {
  expect_map(node, context);
  decode(o.body, node["body"], context.field("body"));
  auto http_version = required_field(node, "http_version", context);
  decode(o.http_version, http_version.node, http_version.context);
  auto status = required_field(node, "status", context);
  decode(o.status, status.node, status.context);
  decode(o.headers, node["headers"], context.field("headers"));
}

}  // namespace vcr::schema::encoding::yaml
