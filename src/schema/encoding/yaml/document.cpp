#include <vcr/common/critical.hpp>
#include <vcr/schema/encoding/yaml/document.hpp>
#include <vcr/schema/errors.hpp>
#include <vcr/schema/json_value.hpp>
#include <vcr/schema/primitives.hpp>

#include <string>

namespace vcr::schema::encoding::yaml {

namespace {

bool reads_back_as_string(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  return vcr::schema::kind_of(::YAML::Node{text}) ==
         vcr::schema::json_kind::string;
}

// YAML admits number spellings that JSON does not: "+1", "007", ".5", "1.".
std::string json_number(std::string text) {
  if (!text.empty() && text.front() == '+') {
    text.erase(0, 1);
  }
  auto digits_at = (!text.empty() && text.front() == '-') ? 1u : 0u;
  while (text.size() > digits_at + 1 && text[digits_at] == '0' &&
         text[digits_at + 1] >= '0' && text[digits_at + 1] <= '9') {
    text.erase(digits_at, 1);
  }
  if (text.size() > digits_at && text[digits_at] == '.') {
    text.insert(digits_at, "0");
  }
  auto exponent = text.find_first_of("eE");
  auto mantissa_end = exponent == std::string::npos ? text.size() : exponent;
  if (mantissa_end > 0 && text[mantissa_end - 1] == '.') {
    text.insert(mantissa_end, "0");
  }
  return text;
}

void emit_string(const std::string& text,
                 ::YAML::Emitter& emitter,
                 const document_style style) {
  if (style == document_style::json) {
    // EscapeAsJson would replace the offending bytes with U+FFFD.
    if (!vcr::schema::is_valid_utf8(text)) {
      throw vcr::schema::schema_error{{}, "string is not valid UTF-8"};
    }
    emitter << ::YAML::DoubleQuoted << text;
    return;
  }
  if (!reads_back_as_string(text)) {
    emitter << ::YAML::DoubleQuoted << text;
    return;
  }
  emitter << text;
}

void emit_scalar(const ::YAML::Node& node,
                 ::YAML::Emitter& emitter,
                 const document_style style) {
  switch (vcr::schema::kind_of(node)) {
    case vcr::schema::json_kind::null:
      emitter << ::YAML::Null;
      return;
    case vcr::schema::json_kind::boolean:
      emitter << (node.Scalar().front() == 't' || node.Scalar().front() == 'T');
      return;
    case vcr::schema::json_kind::number:
      emitter << (style == document_style::json ? json_number(node.Scalar())
                                                : node.Scalar());
      return;
    default:
      emit_string(node.Scalar(), emitter, style);
      return;
  }
}

}  // namespace

::YAML::Node load(const std::string_view text) {
  try {
    return ::YAML::Load(std::string{text});
  } catch (const ::YAML::Exception& ex) {
    throw vcr::schema::schema_error{{}, "malformed document: " + ex.msg};
  }
}

void emit(const ::YAML::Node& node,
          ::YAML::Emitter& emitter,
          const document_style style) {
  switch (node.Type()) {
    case ::YAML::NodeType::Sequence:
      emitter << ::YAML::BeginSeq;
      for (const auto& child : node) {
        emit(child, emitter, style);
      }
      emitter << ::YAML::EndSeq;
      return;
    case ::YAML::NodeType::Map:
      emitter << ::YAML::BeginMap;
      for (const auto& entry : node) {
        emitter << ::YAML::Key;
        if (entry.first.IsScalar()) {
          emit_string(entry.first.Scalar(), emitter, style);
        } else {
          emit(entry.first, emitter, style);
        }
        emitter << ::YAML::Value;
        emit(entry.second, emitter, style);
      }
      emitter << ::YAML::EndMap;
      return;
    case ::YAML::NodeType::Scalar:
      emit_scalar(node, emitter, style);
      return;
    default:
      emitter << ::YAML::Null;
      return;
  }
}

std::string dump(const ::YAML::Node& node, const document_style style) {
  auto emitter = ::YAML::Emitter{};
  emitter.SetNullFormat(::YAML::LowerNull);
  if (style == document_style::json) {
    emitter.SetMapFormat(::YAML::Flow);
    emitter.SetSeqFormat(::YAML::Flow);
    emitter.SetOutputCharset(::YAML::EscapeAsJson);
  }
  emit(node, emitter, style);
  if (!emitter.good()) {
    vcr::common::critical("failed to emit cassette document: {}",
                          emitter.GetLastError());
  }
  return std::string{emitter.c_str(), emitter.size()};
}

}  // namespace vcr::schema::encoding::yaml
