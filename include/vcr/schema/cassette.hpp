#pragma once
#include <vcr/schema/http_interaction.hpp>
#include <vcr/schema/primitives.hpp>
#include <vector>

// Schema type: cassette.
// Cassette format: the document root. Interactions are kept in recording
// order.
namespace vcr::schema {

template <uint16_t Version>
struct cassette;

template <>
struct cassette<1> final {
  std::vector<http_interaction_t> http_interactions;
  recorder_id_t recorded_with;

  bool operator==(const cassette&) const = default;
};

using cassette_t = cassette<1>;

}  // namespace vcr::schema
