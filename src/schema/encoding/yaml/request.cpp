#include <vcr/schema/encoding/yaml/body.hpp>
#include <vcr/schema/encoding/yaml/primitives.hpp>
#include <vcr/schema/encoding/yaml/request.hpp>

using namespace vcr::schema;

namespace vcr::schema::encoding::yaml {

void encode(const request_t& o, ::YAML::Node& node) {
  node = ::YAML::Node{::YAML::NodeType::Map};
  node["uri"] = make_string_node(o.uri);
  auto body = ::YAML::Node{};
  encode(o.body, body);
  node["body"] = body;
  node["method"] = make_string_node(o.method);
  auto headers = ::YAML::Node{};
  encode(o.headers, headers);
  node["headers"] = headers;
}

void decode(request_t& o,
            const ::YAML::Node& node,
            const decode_context& context) {
  expect_map(node, context);
  auto uri = required_field(node, "uri", context);
  decode(o.uri, uri.node, uri.context);
  decode(o.body, node["body"], context.field("body"));
  auto method = required_field(node, "method", context);
  decode(o.method, method.node, method.context);
  decode(o.headers, node["headers"], context.field("headers"));
}

}  // namespace vcr::schema::encoding::yaml
