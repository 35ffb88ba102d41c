#pragma once
#include <vcr/schema/capabilities.hpp>
#include <vcr/schema/cassette.hpp>

namespace vcr::schema {

/// Check an in-memory cassette against the shapes a decode under `caps`
/// would accept: no disabled body variants or matchers, well formed regex
/// rules, unique header names and UTF-8 text in every string. Throws schema_error naming the offending
/// field.
void validate(const cassette_t& cassette, const capabilities& caps = {});

}  // namespace vcr::schema
