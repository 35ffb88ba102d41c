#pragma once
#include <vcr/schema/capabilities.hpp>
#include <vcr/schema/cassette.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vcr::replay {

/// An outgoing request to be answered from a cassette.
struct request_query final {
  std::string method;
  std::string uri;
  std::string body;
};

using request_query_t = request_query;

/// Index of the first interaction, in recording order, whose request has the
/// query's method (compared case-insensitively), the same uri and a body that
/// matches the query body. match_error from a malformed rule propagates.
std::optional<std::size_t> find_interaction(
    const vcr::schema::cassette_t& cassette,
    const request_query_t& query,
    const vcr::schema::capabilities& caps = {});

/// Every interaction find_interaction would accept, in recording order.
std::vector<std::size_t> find_interactions(
    const vcr::schema::cassette_t& cassette,
    const request_query_t& query,
    const vcr::schema::capabilities& caps = {});

}  // namespace vcr::replay
