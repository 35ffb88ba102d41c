#pragma once
#include <vcr/schema/body.hpp>
#include <vcr/schema/capabilities.hpp>
#include <string_view>

namespace vcr::matching {

/// Decide whether a candidate request body satisfies a recorded body.
///
/// Plain bodies compare byte for byte. Json bodies parse the candidate and
/// compare structurally; a candidate that does not parse never matches.
/// Match lists require every rule to match. Throws match_error for a rule
/// that is malformed or whose capability is disabled in `caps`.
bool matches(const vcr::schema::body_t& recorded,
             const std::string_view candidate,
             const vcr::schema::capabilities& caps = {});

/// Evaluate a single rule of a match list.
bool matches(const vcr::schema::body_matcher_t& rule,
             const std::string_view candidate,
             const vcr::schema::capabilities& caps = {});

bool matches(const vcr::schema::response_body_t& recorded,
             const std::string_view candidate);

}  // namespace vcr::matching
