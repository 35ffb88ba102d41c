#pragma once

#include <array>
#include <cctype>
#include <optional>
#include <string_view>
#include <utility>

namespace vcr::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

// ASCII case-insensitive lookup; `mappings` names are expected in lower case.
template <typename Enum, std::size_t N>
std::optional<Enum> from_string_icase(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name.size() != value.size()) {
      continue;
    }
    auto equal = true;
    for (std::size_t i = 0; i < name.size() && equal; ++i) {
      equal = name[i] == std::tolower(static_cast<unsigned char>(value[i]));
    }
    if (equal) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

}  // namespace vcr::schema
