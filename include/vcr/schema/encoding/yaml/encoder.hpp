#pragma once
#include <spdlog/spdlog.h>
#include <vcr/schema/capabilities.hpp>
#include <vcr/schema/encoding/encoder.hpp>
#include <vcr/schema/encoding/yaml/document.hpp>
#include <vcr/schema/errors.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace vcr::schema::encoding {

struct yaml_encoder_tag {};
struct json_encoder_tag {};

namespace yaml {

template <typename T>
T decode_text(const std::string_view text,
              const vcr::schema::capabilities& caps) {
  return from_document<T>(load(text), caps);
}

template <typename T>
std::optional<T> try_decode_text(const std::string_view text,
                                 const vcr::schema::capabilities& caps) {
  try {
    return decode_text<T>(text, caps);
  } catch (const vcr::schema::schema_error& ex) {
    spdlog::debug("Rejected cassette document: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace yaml

template <>
struct encoder<yaml_encoder_tag> final {
  vcr::schema::capabilities caps{};

  template <typename T>
  std::string encode(const T& obj) const {
    return yaml::dump(yaml::to_document(obj), yaml::document_style::block);
  }

  template <typename T>
  T decode(const std::string_view text) const {
    return yaml::decode_text<T>(text, caps);
  }

  template <typename T>
  std::optional<T> try_decode(const std::string_view text) const {
    return yaml::try_decode_text<T>(text, caps);
  }
};

template <>
struct encoder<json_encoder_tag> final {
  vcr::schema::capabilities caps{};

  template <typename T>
  std::string encode(const T& obj) const {
    return yaml::dump(yaml::to_document(obj), yaml::document_style::json);
  }

  template <typename T>
  T decode(const std::string_view text) const {
    return yaml::decode_text<T>(text, caps);
  }

  template <typename T>
  std::optional<T> try_decode(const std::string_view text) const {
    return yaml::try_decode_text<T>(text, caps);
  }
};

}  // namespace vcr::schema::encoding
