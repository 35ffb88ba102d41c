#include <vcr/schema/body.hpp>
#include <vcr/schema/encoding/yaml/document.hpp>
#include <vcr/schema/primitives.hpp>

namespace vcr::schema {

namespace {

std::string quote(const std::string_view text) {
  auto out = std::string{"\""};
  out.append(text);
  out.push_back('"');
  return out;
}

std::string describe_encoded(const encoded_body_t& body) {
  return "(" + body.encoding.value_or("") + ")" + body.string;
}

}  // namespace

std::string describe(const body_matcher_t& matcher) {
  return std::visit(
      overloaded{[](const substring_matcher_t& m) {
                   return "substring(" + quote(m.needle) + ")";
                 },
                 [](const regex_matcher_t& m) {
                   return "regex(" + quote(m.pattern) + ")";
                 }},
      matcher);
}

std::string describe(const body_t& body) {
  return std::visit(
      overloaded{
          [](const plain_body_t& b) { return b.text; },
          [](const encoded_body_t& b) { return describe_encoded(b); },
          [](const json_body_t& b) {
            return encoding::yaml::dump(b.value,
                                        encoding::yaml::document_style::json);
          },
          [](const match_list_body_t& b) {
            auto out = std::string{"["};
            for (std::size_t i = 0; i < b.matchers.size(); ++i) {
              if (i > 0) {
                out.append(", ");
              }
              out.append(describe(b.matchers[i]));
            }
            out.push_back(']');
            return out;
          }},
      body);
}

std::string describe(const response_body_t& body) {
  return std::visit(
      overloaded{[](const plain_body_t& b) { return b.text; },
                 [](const encoded_body_t& b) { return describe_encoded(b); }},
      body);
}

}  // namespace vcr::schema
