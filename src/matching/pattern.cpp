#include <spdlog/spdlog.h>
#include <vcr/matching/pattern.hpp>
#include <vcr/schema/errors.hpp>

#include <stdexcept>
#include <string>

namespace vcr::matching {

boost::regex compile_pattern(const std::string& pattern) {
  auto compiled = try_compile_pattern(pattern);
  if (!compiled) {
    throw vcr::schema::match_error{"invalid regular expression: " + pattern};
  }
  return *std::move(compiled);
}

std::optional<boost::regex> try_compile_pattern(const std::string& pattern) {
  try {
    return boost::regex{pattern, boost::regex::perl};
  } catch (const boost::regex_error& ex) {
    spdlog::warn("Regex rule '{}' does not compile: {}", pattern, ex.what());
    return std::nullopt;
  }
}

bool search_text(const boost::regex& pattern,
                 const std::string_view candidate) {
  try {
    return boost::regex_search(std::begin(candidate), std::end(candidate),
                               pattern);
  } catch (const std::runtime_error& ex) {
    // error_complexity and error_stack arrive as boost::regex_error.
    throw vcr::schema::match_error{std::string{"regex evaluation failed: "} +
                                   ex.what()};
  }
}

}  // namespace vcr::matching
