#include <vcr/schema/json_value.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <string>

namespace vcr::schema {

namespace {

constexpr auto kStringTag = std::string_view{"!"};
constexpr auto kCanonicalStringTag = std::string_view{"tag:yaml.org,2002:str"};

constexpr auto kNullLiterals =
    std::array<std::string_view, 4>{"~", "null", "Null", "NULL"};
constexpr auto kTrueLiterals =
    std::array<std::string_view, 3>{"true", "True", "TRUE"};
constexpr auto kFalseLiterals =
    std::array<std::string_view, 3>{"false", "False", "FALSE"};

bool is_one_of(const std::string_view text, const auto& literals) {
  return std::ranges::find(literals, text) != std::end(literals);
}

std::string_view strip_plus(std::string_view text) {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  return text;
}

std::optional<int64_t> parse_integer(std::string_view text) {
  text = strip_plus(text);
  auto value = int64_t{};
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint64_t> parse_unsigned(std::string_view text) {
  text = strip_plus(text);
  auto value = uint64_t{};
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_real(std::string_view text) {
  text = strip_plus(text);
  if (text.empty()) {
    return std::nullopt;
  }
  // from_chars also accepts inf/nan spellings, which YAML writes as .inf.
  auto allowed = std::ranges::all_of(text, [](const char ch) {
    return (ch >= '0' && ch <= '9') || ch == '.' || ch == 'e' || ch == 'E' ||
           ch == '-' || ch == '+';
  });
  if (!allowed) {
    return std::nullopt;
  }
  auto value = double{};
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

bool numbers_equal(const std::string& lhs, const std::string& rhs) {
  auto lhs_integer = parse_integer(lhs);
  auto rhs_integer = parse_integer(rhs);
  if (lhs_integer && rhs_integer) {
    return *lhs_integer == *rhs_integer;
  }
  auto lhs_unsigned = parse_unsigned(lhs);
  auto rhs_unsigned = parse_unsigned(rhs);
  if (lhs_unsigned && rhs_unsigned) {
    return *lhs_unsigned == *rhs_unsigned;
  }
  // One side is above INT64_MAX and the other negative.
  if ((lhs_integer || lhs_unsigned) && (rhs_integer || rhs_unsigned)) {
    return false;
  }
  auto lhs_real = parse_real(lhs);
  auto rhs_real = parse_real(rhs);
  return lhs_real && rhs_real && *lhs_real == *rhs_real;
}

bool keys_equal(const json_value_t& lhs, const json_value_t& rhs) {
  if (lhs.IsScalar() && rhs.IsScalar()) {
    return lhs.Scalar() == rhs.Scalar();
  }
  return structurally_equal(lhs, rhs);
}

bool objects_equal(const json_value_t& lhs, const json_value_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (const auto& entry : lhs) {
    auto matched = false;
    for (const auto& candidate : rhs) {
      if (keys_equal(entry.first, candidate.first)) {
        matched = structurally_equal(entry.second, candidate.second);
        break;
      }
    }
    if (!matched) {
      return false;
    }
  }
  return true;
}

bool arrays_equal(const json_value_t& lhs, const json_value_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (!structurally_equal(lhs[i], rhs[i])) {
      return false;
    }
  }
  return true;
}

// Strict RFC 8259 grammar. The YAML loader is lenient about comments, single
// quotes and multiple documents, so candidate text is checked here first.
class json_text_checker final {
 public:
  explicit json_text_checker(const std::string_view text) : text_{text} {}

  bool check() {
    skip_spaces();
    if (!value(0)) {
      return false;
    }
    skip_spaces();
    return pos_ == text_.size();
  }

 private:
  static constexpr auto kMaxDepth = std::size_t{512};

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  bool consume(const char ch) {
    if (peek() != ch || at_end()) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool consume(const std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) {
      return false;
    }
    pos_ += literal.size();
    return true;
  }

  void skip_spaces() {
    while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\n' ||
                         peek() == '\r')) {
      ++pos_;
    }
  }

  static bool is_digit(const char ch) { return ch >= '0' && ch <= '9'; }

  static bool is_hex(const char ch) {
    return is_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
  }

  bool digits() {
    if (at_end() || !is_digit(peek())) {
      return false;
    }
    while (!at_end() && is_digit(peek())) {
      ++pos_;
    }
    return true;
  }

  bool value(const std::size_t depth) {
    if (depth > kMaxDepth || at_end()) {
      return false;
    }
    switch (peek()) {
      case '{':
        return object(depth + 1);
      case '[':
        return array(depth + 1);
      case '"':
        return string();
      case 't':
        return consume(std::string_view{"true"});
      case 'f':
        return consume(std::string_view{"false"});
      case 'n':
        return consume(std::string_view{"null"});
      default:
        return number();
    }
  }

  bool object(const std::size_t depth) {
    consume('{');
    skip_spaces();
    if (consume('}')) {
      return true;
    }
    while (true) {
      skip_spaces();
      if (peek() != '"' || !string()) {
        return false;
      }
      skip_spaces();
      if (!consume(':')) {
        return false;
      }
      skip_spaces();
      if (!value(depth)) {
        return false;
      }
      skip_spaces();
      if (consume('}')) {
        return true;
      }
      if (!consume(',')) {
        return false;
      }
    }
  }

  bool array(const std::size_t depth) {
    consume('[');
    skip_spaces();
    if (consume(']')) {
      return true;
    }
    while (true) {
      skip_spaces();
      if (!value(depth)) {
        return false;
      }
      skip_spaces();
      if (consume(']')) {
        return true;
      }
      if (!consume(',')) {
        return false;
      }
    }
  }

  bool string() {
    consume('"');
    while (!at_end()) {
      auto ch = static_cast<unsigned char>(text_[pos_++]);
      if (ch == '"') {
        return true;
      }
      if (ch < 0x20) {
        return false;
      }
      if (ch != '\\') {
        continue;
      }
      if (at_end()) {
        return false;
      }
      auto escape = text_[pos_++];
      if (escape == 'u') {
        for (auto i = 0; i < 4; ++i) {
          if (at_end() || !is_hex(text_[pos_++])) {
            return false;
          }
        }
      } else if (std::string_view{"\"\\/bfnrt"}.find(escape) ==
                 std::string_view::npos) {
        return false;
      }
    }
    return false;
  }

  bool number() {
    consume('-');
    if (consume('0')) {
      if (is_digit(peek())) {
        return false;
      }
    } else if (!digits()) {
      return false;
    }
    if (consume('.') && !digits()) {
      return false;
    }
    if (consume('e') || consume('E')) {
      if (!consume('+')) {
        consume('-');
      }
      if (!digits()) {
        return false;
      }
    }
    return true;
  }

  std::string_view text_;
  std::size_t pos_{0};
};

}  // namespace

bool is_json_text(const std::string_view text) {
  return json_text_checker{text}.check();
}

json_kind kind_of(const json_value_t& value) {
  switch (value.Type()) {
    case ::YAML::NodeType::Sequence:
      return json_kind::array;
    case ::YAML::NodeType::Map:
      return json_kind::object;
    case ::YAML::NodeType::Scalar:
      break;
    default:
      return json_kind::null;
  }

  const auto& tag = value.Tag();
  if (tag == kStringTag || tag == kCanonicalStringTag) {
    return json_kind::string;
  }
  const auto& text = value.Scalar();
  if (text.empty() || is_one_of(text, kNullLiterals)) {
    return json_kind::null;
  }
  if (is_one_of(text, kTrueLiterals) || is_one_of(text, kFalseLiterals)) {
    return json_kind::boolean;
  }
  if (parse_integer(text) || parse_real(text)) {
    return json_kind::number;
  }
  return json_kind::string;
}

bool structurally_equal(const json_value_t& lhs, const json_value_t& rhs) {
  auto kind = kind_of(lhs);
  if (kind != kind_of(rhs)) {
    return false;
  }
  switch (kind) {
    case json_kind::null:
      return true;
    case json_kind::boolean:
      return is_one_of(lhs.Scalar(), kTrueLiterals) ==
             is_one_of(rhs.Scalar(), kTrueLiterals);
    case json_kind::number:
      return numbers_equal(lhs.Scalar(), rhs.Scalar());
    case json_kind::string:
      return lhs.Scalar() == rhs.Scalar();
    case json_kind::array:
      return arrays_equal(lhs, rhs);
    case json_kind::object:
      return objects_equal(lhs, rhs);
  }
  return false;
}

json_value_t make_json_string(const std::string_view text) {
  auto node = json_value_t{std::string{text}};
  node.SetTag(std::string{kStringTag});
  return node;
}

}  // namespace vcr::schema
