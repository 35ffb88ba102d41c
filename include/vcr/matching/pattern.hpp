#pragma once
#include <boost/regex.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace vcr::matching {

/// Compile a regex rule pattern (Perl syntax, including inline flags such as
/// `(?i)`). Throws match_error when the pattern is malformed.
boost::regex compile_pattern(const std::string& pattern);

std::optional<boost::regex> try_compile_pattern(const std::string& pattern);

/// Search `candidate` for a match anywhere. Throws match_error when the
/// engine gives up on a pathological pattern/input pair.
bool search_text(const boost::regex& pattern,
                 const std::string_view candidate);

}  // namespace vcr::matching
