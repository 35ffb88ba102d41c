#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace vcr::schema::encoding {

// Text codec selected at build time by a library tag. Every specialization
// accepts JSON and YAML input; the tag picks the syntax that `encode` emits.
template <typename Library>
struct encoder {
  template <typename T>
  std::string encode(const T& obj) const;

  template <typename T>
  T decode(const std::string_view text) const;

  template <typename T>
  std::optional<T> try_decode(const std::string_view text) const;
};

}  // namespace vcr::schema::encoding
