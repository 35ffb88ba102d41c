#include <vcr/schema/encoding/yaml/cassette.hpp>
#include <vcr/schema/encoding/yaml/http_interaction.hpp>
#include <vcr/schema/encoding/yaml/primitives.hpp>

using namespace vcr::schema;

namespace vcr::schema::encoding::yaml {

void encode(const cassette_t& o, ::YAML::Node& node) {
  node = ::YAML::Node{::YAML::NodeType::Map};
  auto interactions = ::YAML::Node{::YAML::NodeType::Sequence};
  for (const auto& interaction : o.http_interactions) {
    auto child = ::YAML::Node{};
    encode(interaction, child);
    interactions.push_back(child);
  }
  node["http_interactions"] = interactions;
  node["recorded_with"] = make_string_node(o.recorded_with);
}

void decode(cassette_t& o,
            const ::YAML::Node& node,
            const decode_context& context) {
  expect_map(node, context);
  auto interactions = required_field(node, "http_interactions", context);
  if (!interactions.node.IsSequence()) {
    interactions.context.fail("expected a sequence of interactions");
  }
  o.http_interactions.clear();
  o.http_interactions.reserve(interactions.node.size());
  for (std::size_t i = 0; i < interactions.node.size(); ++i) {
    auto interaction = http_interaction_t{};
    decode(interaction, interactions.node[i], interactions.context.element(i));
    o.http_interactions.push_back(std::move(interaction));
  }
  auto recorded_with = required_field(node, "recorded_with", context);
  decode(o.recorded_with, recorded_with.node, recorded_with.context);
}

}  // namespace vcr::schema::encoding::yaml
