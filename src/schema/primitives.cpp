#include <vcr/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace vcr::schema {

namespace {

std::optional<uint8_t> base64_sextet(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<uint8_t>(ch - 'A');
  }
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<uint8_t>(ch - 'a' + 26);
  }
  if (ch >= '0' && ch <= '9') {
    return static_cast<uint8_t>(ch - '0' + 52);
  }
  if (ch == '+') {
    return uint8_t{62};
  }
  if (ch == '/') {
    return uint8_t{63};
  }
  return std::nullopt;
}

char ascii_lower(const char ch) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

}  // namespace

const header_values_t* find_header(const headers_t& headers,
                                   const std::string_view name) {
  auto it = std::ranges::find_if(
      headers, [&](const header_entry_t& entry) { return entry.first == name; });
  if (it == std::end(headers)) {
    return nullptr;
  }
  return &it->second;
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

// Whitespace is skipped so that line-wrapped recordings decode.
std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::ranges::copy_if(encoded, std::back_inserter(compact), [](const char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) == 0;
  });

  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);

  for (size_t i = 0; i < compact.size(); i += 4) {
    auto is_last_chunk = (i + 4) == compact.size();
    auto padding = size_t{0};
    if (compact[i + 3] == '=') {
      padding = compact[i + 2] == '=' ? 2 : 1;
    }
    if (padding > 0 && !is_last_chunk) {
      return std::nullopt;
    }

    auto value = uint32_t{0};
    for (size_t j = 0; j < 4 - padding; ++j) {
      auto sextet = base64_sextet(compact[i + j]);
      if (!sextet) {
        return std::nullopt;
      }
      value |= static_cast<uint32_t>(*sextet) << (18u - (6u * j));
    }

    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }

  return out;
}

// Rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(const std::string_view text) {
  auto i = size_t{0};
  while (i < text.size()) {
    auto lead = static_cast<unsigned char>(text[i]);
    auto length = size_t{0};
    auto min = uint32_t{0};
    auto code_point = uint32_t{0};
    if (lead < 0x80u) {
      ++i;
      continue;
    } else if ((lead & 0xE0u) == 0xC0u) {
      length = 2;
      min = 0x80u;
      code_point = lead & 0x1Fu;
    } else if ((lead & 0xF0u) == 0xE0u) {
      length = 3;
      min = 0x800u;
      code_point = lead & 0x0Fu;
    } else if ((lead & 0xF8u) == 0xF0u) {
      length = 4;
      min = 0x10000u;
      code_point = lead & 0x07u;
    } else {
      return false;
    }
    if ((i + length) > text.size()) {
      return false;
    }
    for (size_t j = 1; j < length; ++j) {
      auto trail = static_cast<unsigned char>(text[i + j]);
      if ((trail & 0xC0u) != 0x80u) {
        return false;
      }
      code_point = (code_point << 6u) | (trail & 0x3Fu);
    }
    if (code_point < min || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
      return false;
    }
    i += length;
  }
  return true;
}

bool iequals(const std::string_view lhs, const std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, [](const char a, const char b) {
    return ascii_lower(a) == ascii_lower(b);
  });
}

}  // namespace vcr::schema
