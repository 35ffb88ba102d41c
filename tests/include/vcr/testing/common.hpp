#pragma once

#include <vcr/schema/cassette.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#ifndef VCR_FIXTURES_DIR
#define VCR_FIXTURES_DIR "tests/fixtures"
#endif

namespace vcr::testing {

inline std::string fixture_path(const std::string_view name) {
  return (std::filesystem::path{VCR_FIXTURES_DIR} / name).string();
}

inline std::string read_fixture(const std::string_view name) {
  auto in = std::ifstream{fixture_path(name), std::ios::binary};
  auto buffer = std::ostringstream{};
  buffer << in.rdbuf();
  return buffer.str();
}

inline vcr::schema::request_t make_request(std::string method,
                                           std::string uri,
                                           vcr::schema::body_t body = {}) {
  return vcr::schema::request_t{.uri = std::move(uri),
                                .body = std::move(body),
                                .method = std::move(method),
                                .headers = {}};
}

inline vcr::schema::http_interaction_t make_interaction(
    vcr::schema::request_t request,
    std::string response_text = "ok") {
  return vcr::schema::http_interaction_t{
      .request = std::move(request),
      .response =
          vcr::schema::response_t{
              .body = vcr::schema::plain_body_t{.text =
                                                    std::move(response_text)},
              .http_version = "1.1",
              .status = vcr::schema::status_t{.code = 200, .message = "OK"},
              .headers = {{"Content-Type", {"text/plain"}}}},
      .recorded_at = "Tue, 01 Nov 2011 04:58:44 GMT"};
}

}  // namespace vcr::testing
