#include <vcr/schema/encoding/yaml/decode_context.hpp>
#include <vcr/schema/errors.hpp>

namespace vcr::schema::encoding::yaml {

decode_context decode_context::field(const std::string_view name) const {
  auto child = decode_context{.caps = caps, .path = path};
  if (!child.path.empty()) {
    child.path.push_back('.');
  }
  child.path.append(name);
  return child;
}

decode_context decode_context::element(const std::size_t index) const {
  auto child = decode_context{.caps = caps, .path = path};
  child.path += "[" + std::to_string(index) + "]";
  return child;
}

void decode_context::fail(const std::string_view message) const {
  throw vcr::schema::schema_error{path, message};
}

}  // namespace vcr::schema::encoding::yaml
