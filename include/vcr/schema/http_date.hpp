#pragma once
#include <vcr/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace vcr::schema {

/// Parse an RFC 2822 / RFC 7231 date such as "Tue, 01 Nov 2011 04:58:44 GMT"
/// into milliseconds since the Unix epoch.
///
/// The weekday prefix is optional and not cross-checked. Accepted zones are
/// GMT, UT, UTC, Z and numeric +hhmm / -hhmm offsets. Dates before the epoch
/// are rejected.
std::optional<timestamp_milliseconds_t> try_parse_http_date(
    const std::string_view text);

}  // namespace vcr::schema
