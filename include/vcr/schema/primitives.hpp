#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vcr::schema {

using bytes_t = std::vector<uint8_t>;
using timestamp_milliseconds_t = uint64_t;

// Identifier of the library which created the recording, eg "VCR 2.0.0".
using recorder_id_t = std::string;

// Headers keep document order for both names and values. Names are unique and
// compared exactly; no case folding is applied.
using header_values_t = std::vector<std::string>;
using header_entry_t = std::pair<std::string, header_values_t>;
using headers_t = std::vector<header_entry_t>;

const header_values_t* find_header(const headers_t& headers,
                                   const std::string_view name);

std::string make_string(const bytes_t& bytes);

std::optional<bytes_t> try_from_base64(const std::string_view encoded);

bool is_valid_utf8(const std::string_view text);

bool iequals(const std::string_view lhs, const std::string_view rhs);

}  // namespace vcr::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
