#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace vcr::schema {

/// A document does not have the cassette shape, or uses a shape whose
/// capability is disabled.
///
/// `path()` locates the offending field, eg
/// `http_interactions[0].request.body.matches[1].regex`; it is empty for
/// failures that concern the whole document.
class schema_error final : public std::runtime_error {
 public:
  schema_error(std::string path, const std::string_view message);

  const std::string& path() const;

 private:
  std::string path_;
};

/// A match rule is malformed (eg an invalid regular expression) or is not
/// supported by the active capabilities. A body that merely fails to match is
/// never reported this way.
class match_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace vcr::schema
