#include <vcr/schema/errors.hpp>

#include <utility>

namespace vcr::schema {

namespace {

std::string make_what(const std::string& path, const std::string_view message) {
  if (path.empty()) {
    return std::string{message};
  }
  auto what = path;
  what += ": ";
  what += message;
  return what;
}

}  // namespace

schema_error::schema_error(std::string path, const std::string_view message)
    : std::runtime_error(make_what(path, message)), path_(std::move(path)) {}

const std::string& schema_error::path() const {
  return path_;
}

}  // namespace vcr::schema
