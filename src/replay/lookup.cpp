#include <spdlog/spdlog.h>
#include <vcr/matching/body_matcher.hpp>
#include <vcr/replay/lookup.hpp>
#include <vcr/schema/primitives.hpp>

namespace {

bool accepts(const vcr::schema::request_t& recorded,
             const vcr::replay::request_query_t& query,
             const vcr::schema::capabilities& caps) {
  if (!vcr::schema::iequals(recorded.method, query.method)) {
    return false;
  }
  if (recorded.uri != query.uri) {
    return false;
  }
  return vcr::matching::matches(recorded.body, query.body, caps);
}

}  // namespace

namespace vcr::replay {

std::optional<std::size_t> find_interaction(
    const vcr::schema::cassette_t& cassette,
    const request_query_t& query,
    const vcr::schema::capabilities& caps) {
  for (std::size_t i = 0; i < cassette.http_interactions.size(); ++i) {
    if (accepts(cassette.http_interactions[i].request, query, caps)) {
      spdlog::debug("Replaying interaction {} for {} {}", i, query.method,
                    query.uri);
      return i;
    }
  }
  spdlog::debug("No recorded interaction for {} {}", query.method, query.uri);
  return std::nullopt;
}

std::vector<std::size_t> find_interactions(
    const vcr::schema::cassette_t& cassette,
    const request_query_t& query,
    const vcr::schema::capabilities& caps) {
  auto found = std::vector<std::size_t>{};
  for (std::size_t i = 0; i < cassette.http_interactions.size(); ++i) {
    if (accepts(cassette.http_interactions[i].request, query, caps)) {
      found.push_back(i);
    }
  }
  spdlog::debug("{} recorded interaction(s) for {} {}", found.size(),
                query.method, query.uri);
  return found;
}

}  // namespace vcr::replay
