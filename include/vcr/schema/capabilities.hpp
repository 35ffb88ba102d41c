#pragma once

namespace vcr::schema {

/// Optional cassette features. A disabled feature makes the shapes that
/// depend on it a schema error when decoding and a match error when matching.
struct capabilities final {
  /// `{"json": value}` request bodies.
  bool json{true};
  /// `{"matches": [rule]}` request bodies.
  bool matching{true};
  /// `{"regex": pattern}` rules inside a match list.
  bool regex{true};

  static constexpr capabilities all() { return capabilities{}; }

  static constexpr capabilities none() {
    return capabilities{.json = false, .matching = false, .regex = false};
  }

  bool operator==(const capabilities&) const = default;
};

}  // namespace vcr::schema
