#include <vcr/schema/encoding/yaml/primitives.hpp>
#include <vcr/schema/encoding/yaml/status.hpp>

using namespace vcr::schema;

namespace vcr::schema::encoding::yaml {

void encode(const status_t& o, ::YAML::Node& node) {
  node = ::YAML::Node{::YAML::NodeType::Map};
  node["code"] = o.code;
  node["message"] = make_string_node(o.message);
}

void decode(status_t& o, const ::YAML::Node& node, const decode_context& context) {
  expect_map(node, context);
  auto code = required_field(node, "code", context);
  decode(o.code, code.node, code.context);
  auto message = required_field(node, "message", context);
  decode(o.message, message.node, message.context);
}

}  // namespace vcr::schema::encoding::yaml
