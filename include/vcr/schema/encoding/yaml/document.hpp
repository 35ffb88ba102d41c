#pragma once
#include <vcr/schema/capabilities.hpp>
#include <vcr/schema/encoding/yaml/body.hpp>
#include <vcr/schema/encoding/yaml/cassette.hpp>
#include <vcr/schema/encoding/yaml/decode_context.hpp>
#include <vcr/schema/encoding/yaml/http_interaction.hpp>
#include <vcr/schema/encoding/yaml/primitives.hpp>
#include <vcr/schema/encoding/yaml/request.hpp>
#include <vcr/schema/encoding/yaml/response.hpp>
#include <vcr/schema/encoding/yaml/status.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace vcr::schema::encoding::yaml {

enum class document_style : uint8_t {
  // Block YAML; strings are quoted only when they would read back as
  // another type.
  block = 0,
  // Single-line JSON.
  json = 1,
};

/// Parse JSON or YAML text into a document tree.
///
/// Syntax errors are reported as a schema_error with an empty path.
::YAML::Node load(const std::string_view text);

/// Emit a document tree, quoting scalars so that they resolve to the same
/// JSON kind when loaded again.
std::string dump(const ::YAML::Node& node, const document_style style);

void emit(const ::YAML::Node& node,
          ::YAML::Emitter& emitter,
          const document_style style);

/// Decode a document tree into a schema value. Throws schema_error.
template <typename T>
T from_document(const ::YAML::Node& document,
                const vcr::schema::capabilities& caps = {}) {
  auto out = T{};
  decode(out, document, decode_context{.caps = caps, .path = {}});
  return out;
}

/// Encode a schema value into a document tree accepted by from_document.
template <typename T>
::YAML::Node to_document(const T& obj) {
  auto node = ::YAML::Node{};
  encode(obj, node);
  return node;
}

}  // namespace vcr::schema::encoding::yaml
