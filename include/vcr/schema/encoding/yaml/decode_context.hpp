#pragma once
#include <vcr/schema/capabilities.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace vcr::schema::encoding::yaml {

/// Capabilities and document position threaded through a decode.
struct decode_context final {
  vcr::schema::capabilities caps{};
  std::string path;

  decode_context field(const std::string_view name) const;
  decode_context element(const std::size_t index) const;

  /// Throw a schema_error located at `path`.
  [[noreturn]] void fail(const std::string_view message) const;
};

}  // namespace vcr::schema::encoding::yaml
