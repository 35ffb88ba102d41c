#include <spdlog/spdlog.h>
#include <vcr/matching/body_matcher.hpp>
#include <vcr/matching/pattern.hpp>
#include <vcr/schema/encoding/yaml/document.hpp>
#include <vcr/schema/errors.hpp>
#include <vcr/schema/primitives.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

using namespace vcr::schema;

namespace {

std::optional<json_value_t> try_load_json(const std::string_view candidate) {
  if (!is_json_text(candidate)) {
    spdlog::debug("Candidate body of {} bytes is not JSON text",
                  candidate.size());
    return std::nullopt;
  }
  try {
    return vcr::schema::encoding::yaml::load(candidate);
  } catch (const schema_error& ex) {
    spdlog::debug("Candidate body is not a JSON document: {}", ex.what());
    return std::nullopt;
  }
}

bool matches_encoded(const encoded_body_t& recorded,
                     const std::string_view candidate) {
  if (!recorded.encoding || *recorded.encoding == "identity") {
    return recorded.string == candidate;
  }
  if (*recorded.encoding == "base64") {
    auto decoded = try_from_base64(recorded.string);
    if (!decoded) {
      spdlog::debug("Recorded base64 body does not decode");
      return false;
    }
    return make_string(*decoded) == candidate;
  }
  spdlog::debug("Unsupported body encoding '{}'", *recorded.encoding);
  return false;
}

bool matches_json(const json_body_t& recorded, const std::string_view candidate) {
  auto document = try_load_json(candidate);
  if (!document) {
    return false;
  }
  return structurally_equal(recorded.value, *document);
}

}  // namespace

namespace vcr::matching {

bool matches(const body_matcher_t& rule,
             const std::string_view candidate,
             const capabilities& caps) {
  return std::visit(
      overloaded{
          [&](const substring_matcher_t& m) {
            return candidate.find(m.needle) != std::string_view::npos;
          },
          [&](const regex_matcher_t& m) {
            if (!caps.regex) {
              throw match_error{"unsupported matcher 'regex'"};
            }
            return search_text(compile_pattern(m.pattern), candidate);
          }},
      rule);
}

bool matches(const body_t& recorded,
             const std::string_view candidate,
             const capabilities& caps) {
  auto result = std::visit(
      overloaded{
          [&](const plain_body_t& b) { return b.text == candidate; },
          [&](const encoded_body_t& b) { return matches_encoded(b, candidate); },
          [&](const json_body_t& b) {
            if (!caps.json) {
              throw match_error{"unsupported matcher 'json'"};
            }
            return matches_json(b, candidate);
          },
          [&](const match_list_body_t& b) {
            if (!caps.matching) {
              throw match_error{"unsupported matcher 'matches'"};
            }
            return std::ranges::all_of(
                b.matchers, [&](const body_matcher_t& rule) {
                  return matches(rule, candidate, caps);
                });
          }},
      recorded);
  if (!result && spdlog::should_log(spdlog::level::debug)) {
    spdlog::debug("Body {} rejected candidate of {} bytes", describe(recorded),
                  candidate.size());
  }
  return result;
}

bool matches(const response_body_t& recorded, const std::string_view candidate) {
  return std::visit(
      overloaded{
          [&](const plain_body_t& b) { return b.text == candidate; },
          [&](const encoded_body_t& b) { return matches_encoded(b, candidate); }},
      recorded);
}

}  // namespace vcr::matching
