#include <gtest/gtest.h>
#include <vcr/schema/cassette.hpp>
#include <vcr/schema/encoding/yaml/encoder.hpp>
#include <vcr/schema/errors.hpp>
#include <vcr/testing/common.hpp>

#include <string>
#include <string_view>

namespace {

using yaml_encoder_t =
    vcr::schema::encoding::encoder<vcr::schema::encoding::yaml_encoder_tag>;
using json_encoder_t =
    vcr::schema::encoding::encoder<vcr::schema::encoding::json_encoder_tag>;

std::string document_with_request_body(const std::string_view body) {
  return std::string{
             R"({"http_interactions":[{"request":{"uri":"http://localhost/","body":)"} +
         std::string{body} +
         R"(,"method":"post","headers":{}},"response":{"body":"ok","http_version":"1.1","status":{"code":200,"message":"OK"},"headers":{}},"recorded_at":"Tue, 01 Nov 2011 04:58:44 GMT"}],"recorded_with":"VCR 6.0.0"})";
}

vcr::schema::json_value_t parse(const std::string_view text) {
  return vcr::schema::encoding::yaml::load(text);
}

// Every body variant plus strings that would resolve to other types if
// written unquoted.
vcr::schema::cassette_t make_rich_cassette() {
  auto cassette = vcr::schema::cassette_t{.http_interactions = {},
                                          .recorded_with = "VCR 6.0.0"};

  auto plain = vcr::testing::make_interaction(vcr::testing::make_request(
      "get", "http://localhost:7777/foo", vcr::schema::plain_body_t{}));
  plain.request.headers = {{"Accept", {"text/html", "application/json"}},
                           {"Accept-Encoding", {"identity"}},
                           {"X-Empty", {}}};
  plain.response.headers = {{"Content-Length", {"9"}},
                            {"Date", {"Thu, 27 Oct 2011 06:16:31 GMT"}}};
  cassette.http_interactions.push_back(plain);

  auto tricky = vcr::testing::make_interaction(
      vcr::testing::make_request(
          "post", "http://localhost:7777/tricky",
          vcr::schema::plain_body_t{.text = "line one\nline two: \"quoted\""}),
      "42");
  tricky.request.headers = {{"X-Number", {"42", "1.5", "-3"}},
                            {"X-Literal", {"true", "null", "~", ""}},
                            {"X-Symbols", {"#hash", "- dash", "a: b", " pad "}}};
  tricky.response.status = vcr::schema::status_t{.code = -1, .message = "null"};
  tricky.response.http_version = "2";
  cassette.http_interactions.push_back(tricky);

  auto encoded = vcr::testing::make_interaction(vcr::testing::make_request(
      "put", "http://localhost:7777/upload",
      vcr::schema::encoded_body_t{.encoding = "base64",
                                  .string = "aGVsbG8gd29ybGQ="}));
  encoded.response.body =
      vcr::schema::encoded_body_t{.encoding = std::nullopt, .string = "raw"};
  cassette.http_interactions.push_back(encoded);

  auto json = vcr::testing::make_interaction(vcr::testing::make_request(
      "post", "http://localhost:7777/users",
      vcr::schema::json_body_t{.value = parse(
          R"({"name":"alice","id":"42","age":42,"score":1.5,"ok":true,"none":null,"tags":["a","1",2,[]],"meta":{}})")}));
  cassette.http_interactions.push_back(json);

  auto matched = vcr::testing::make_interaction(vcr::testing::make_request(
      "post", "http://localhost:7777/search",
      vcr::schema::match_list_body_t{
          .matchers = {vcr::schema::substring_matcher_t{.needle = "query="},
                       vcr::schema::regex_matcher_t{.pattern = R"(limit=\d+)"}}}));
  cassette.http_interactions.push_back(matched);

  auto empty_rules = vcr::testing::make_interaction(vcr::testing::make_request(
      "delete", "http://localhost:7777/any", vcr::schema::match_list_body_t{}));
  cassette.http_interactions.push_back(empty_rules);

  return cassette;
}

void expect_schema_error_at(const std::string& text,
                            const std::string& path,
                            const vcr::schema::capabilities& caps = {}) {
  try {
    yaml_encoder_t{.caps = caps}.decode<vcr::schema::cassette_t>(text);
    FAIL() << "expected a schema_error at " << path;
  } catch (const vcr::schema::schema_error& ex) {
    EXPECT_EQ(ex.path(), path) << ex.what();
  }
}

}  // namespace

TEST(encoding_types, readme_example_decodes) {
  auto cassette = json_encoder_t{}.decode<vcr::schema::cassette_t>(
      vcr::testing::read_fixture("example.json"));

  ASSERT_EQ(cassette.http_interactions.size(), 1u);
  EXPECT_EQ(cassette.recorded_with, "VCR 2.0.0");
  const auto& interaction = cassette.http_interactions[0];
  EXPECT_EQ(interaction.response.status.code, 200);
  EXPECT_EQ(interaction.response.status.message, "OK");
  EXPECT_EQ(interaction.request.method, "get");
  EXPECT_EQ(interaction.request.uri, "http://localhost:7777/foo");
  EXPECT_EQ(interaction.request.body,
            vcr::schema::body_t{vcr::schema::plain_body_t{}});
  EXPECT_EQ(interaction.response.body,
            vcr::schema::response_body_t{
                vcr::schema::plain_body_t{.text = "Hello foo"}});
  EXPECT_EQ(interaction.recorded_at, "Tue, 01 Nov 2011 04:58:44 GMT");

  ASSERT_EQ(interaction.response.headers.size(), 3u);
  EXPECT_EQ(interaction.response.headers[0].first, "Date");
  EXPECT_EQ(interaction.response.headers[1].first, "Content-Type");
  EXPECT_EQ(interaction.response.headers[2].first, "Content-Length");
  EXPECT_EQ(interaction.response.headers[2].second,
            (vcr::schema::header_values_t{"9"}));
}

TEST(encoding_types, yaml_fixture_decodes_every_request_body_shape) {
  auto cassette = yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
      vcr::testing::read_fixture("example.yaml"));

  ASSERT_EQ(cassette.http_interactions.size(), 2u);
  EXPECT_EQ(cassette.recorded_with, "VCR 6.0.0");

  const auto& search = cassette.http_interactions[0];
  auto expected_rules = vcr::schema::body_t{vcr::schema::match_list_body_t{
      .matchers = {vcr::schema::substring_matcher_t{.needle = "query="},
                   vcr::schema::regex_matcher_t{.pattern = R"(limit=\d+)"}}}};
  EXPECT_EQ(search.request.body, expected_rules);
  auto* accept = vcr::schema::find_header(search.request.headers, "Accept");
  ASSERT_NE(accept, nullptr);
  EXPECT_EQ(*accept,
            (vcr::schema::header_values_t{"text/html", "application/json"}));
  EXPECT_EQ(search.response.http_version, "1.1");

  const auto& users = cassette.http_interactions[1];
  ASSERT_TRUE(std::holds_alternative<vcr::schema::json_body_t>(users.request.body));
  EXPECT_EQ(
      users.request.body,
      vcr::schema::body_t{vcr::schema::json_body_t{.value = parse(
          R"({"active":true,"age":42,"manager":null,"name":"alice","roles":["admin","42"]})")}});
  EXPECT_TRUE(users.request.headers.empty());
  EXPECT_EQ(users.response.body,
            (vcr::schema::response_body_t{vcr::schema::encoded_body_t{
                .encoding = "base64", .string = "Y3JlYXRlZA=="}}));
  EXPECT_EQ(users.response.status.code, 201);
}

TEST(encoding_types, json_round_trip_preserves_cassette) {
  auto cassette = make_rich_cassette();
  auto encoder = json_encoder_t{};
  auto text = encoder.encode(cassette);
  EXPECT_EQ(text.find('\n'), std::string::npos);
  EXPECT_EQ(encoder.decode<vcr::schema::cassette_t>(text), cassette);
}

TEST(encoding_types, yaml_round_trip_preserves_cassette) {
  auto cassette = make_rich_cassette();
  auto encoder = yaml_encoder_t{};
  auto text = encoder.encode(cassette);
  EXPECT_EQ(encoder.decode<vcr::schema::cassette_t>(text), cassette) << text;
}

TEST(encoding_types, json_encode_rejects_text_that_is_not_utf8) {
  auto cassette = vcr::schema::cassette_t{.http_interactions = {},
                                          .recorded_with = "VCR 6.0.0"};
  cassette.http_interactions.push_back(vcr::testing::make_interaction(
      vcr::testing::make_request("post", "http://localhost/",
                                 vcr::schema::plain_body_t{.text = "\xff\xfe"})));
  EXPECT_THROW(json_encoder_t{}.encode(cassette), vcr::schema::schema_error);

  cassette.http_interactions[0].request.body = vcr::schema::plain_body_t{};
  cassette.http_interactions[0].response.status.message = "\xff\xfe";
  EXPECT_THROW(json_encoder_t{}.encode(cassette), vcr::schema::schema_error);

  cassette.http_interactions[0].response.status.message = "caf\xC3\xA9";
  auto text = json_encoder_t{}.encode(cassette);
  EXPECT_EQ(json_encoder_t{}.decode<vcr::schema::cassette_t>(text), cassette);
}

TEST(encoding_types, json_output_normalises_yaml_number_spellings) {
  auto cassette = yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
      document_with_request_body(
          R"({"json":{"a":007,"b":-007,"c":+1,"d":.5,"e":00.25,"f":0}})"));
  auto text = json_encoder_t{}.encode(cassette);
  EXPECT_TRUE(vcr::schema::is_json_text(text)) << text;
  EXPECT_EQ(text.find("007"), std::string::npos) << text;
  EXPECT_EQ(text.find("00.25"), std::string::npos) << text;
  EXPECT_EQ(json_encoder_t{}.decode<vcr::schema::cassette_t>(text), cassette);
}

TEST(encoding_types, either_decoder_reads_the_other_syntax) {
  auto cassette = make_rich_cassette();
  EXPECT_EQ(yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
                json_encoder_t{}.encode(cassette)),
            cassette);
  EXPECT_EQ(json_encoder_t{}.decode<vcr::schema::cassette_t>(
                yaml_encoder_t{}.encode(cassette)),
            cassette);
}

TEST(encoding_types, header_and_interaction_order_survive_round_trip) {
  auto cassette = make_rich_cassette();
  auto decoded = yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
      yaml_encoder_t{}.encode(cassette));

  ASSERT_EQ(decoded.http_interactions.size(),
            cassette.http_interactions.size());
  for (std::size_t i = 0; i < cassette.http_interactions.size(); ++i) {
    EXPECT_EQ(decoded.http_interactions[i].request.uri,
              cassette.http_interactions[i].request.uri);
  }
  const auto& headers = decoded.http_interactions[0].request.headers;
  ASSERT_EQ(headers.size(), 3u);
  EXPECT_EQ(headers[0].first, "Accept");
  EXPECT_EQ(headers[0].second,
            (vcr::schema::header_values_t{"text/html", "application/json"}));
  EXPECT_EQ(headers[1].first, "Accept-Encoding");
  EXPECT_EQ(headers[2].first, "X-Empty");
  EXPECT_TRUE(headers[2].second.empty());
}

TEST(encoding_types, empty_plain_body_is_written_as_empty_string) {
  auto cassette = vcr::schema::cassette_t{.http_interactions = {},
                                          .recorded_with = "VCR 6.0.0"};
  cassette.http_interactions.push_back(vcr::testing::make_interaction(
      vcr::testing::make_request("get", "http://localhost/")));

  auto document = parse(json_encoder_t{}.encode(cassette));
  auto body = document["http_interactions"][0]["request"]["body"];
  ASSERT_TRUE(body.IsScalar());
  EXPECT_EQ(body.Scalar(), "");
  EXPECT_EQ(vcr::schema::kind_of(body), vcr::schema::json_kind::string);
}

TEST(encoding_types, absent_and_null_bodies_decode_as_empty_plain) {
  auto empty = vcr::schema::body_t{vcr::schema::plain_body_t{}};
  auto from_null = yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
      document_with_request_body("null"));
  EXPECT_EQ(from_null.http_interactions[0].request.body, empty);

  auto from_empty = yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
      document_with_request_body(R"("")"));
  EXPECT_EQ(from_empty.http_interactions[0].request.body, empty);

  auto without_body = yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
      R"({"http_interactions":[{"request":{"uri":"u","method":"get"},"response":{"http_version":"1.1","status":{"code":204,"message":"No Content"}},"recorded_at":"now"}],"recorded_with":"VCR"})");
  const auto& interaction = without_body.http_interactions[0];
  EXPECT_EQ(interaction.request.body, empty);
  EXPECT_TRUE(interaction.request.headers.empty());
  EXPECT_EQ(interaction.response.body,
            vcr::schema::response_body_t{vcr::schema::plain_body_t{}});
}

TEST(encoding_types, encoded_body_accepts_null_encoding) {
  auto cassette = yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
      document_with_request_body(R"({"encoding":null,"string":"abc"})"));
  EXPECT_EQ(cassette.http_interactions[0].request.body,
            (vcr::schema::body_t{vcr::schema::encoded_body_t{
                .encoding = std::nullopt, .string = "abc"}}));
}

TEST(encoding_types, unknown_record_fields_are_ignored) {
  auto cassette = yaml_encoder_t{}.decode<vcr::schema::cassette_t>(
      R"({"http_interactions":[],"recorded_with":"VCR","comment":"extra"})");
  EXPECT_TRUE(cassette.http_interactions.empty());
  EXPECT_EQ(cassette.recorded_with, "VCR");
}

TEST(encoding_types, missing_required_fields_are_reported_by_path) {
  expect_schema_error_at(R"({"http_interactions":[]})", "recorded_with");
  expect_schema_error_at(R"({"recorded_with":"VCR"})", "http_interactions");
  expect_schema_error_at(
      R"({"http_interactions":[{"request":{"uri":"u"},"response":{},"recorded_at":"x"}],"recorded_with":"VCR"})",
      "http_interactions[0].request.method");
  expect_schema_error_at(
      R"({"http_interactions":[{"request":{"uri":"u","method":"get"},"response":{"http_version":"1.1","status":{"code":200}},"recorded_at":"x"}],"recorded_with":"VCR"})",
      "http_interactions[0].response.status.message");
}

TEST(encoding_types, wrong_shapes_are_reported_by_path) {
  expect_schema_error_at(vcr::testing::read_fixture("invalid.json"),
                         "http_interactions[0].response.status.code");
  expect_schema_error_at(R"({"http_interactions":{},"recorded_with":"VCR"})",
                         "http_interactions");
  expect_schema_error_at(
      R"({"http_interactions":[{"request":{"uri":"u","method":"get","headers":{"Accept":"text/html"}},"response":{"http_version":"1.1","status":{"code":200,"message":"OK"}},"recorded_at":"x"}],"recorded_with":"VCR"})",
      "http_interactions[0].request.headers.Accept");
  expect_schema_error_at(
      R"({"http_interactions":[{"request":{"uri":"u","method":"get","headers":["Accept"]},"response":{"http_version":"1.1","status":{"code":200,"message":"OK"}},"recorded_at":"x"}],"recorded_with":"VCR"})",
      "http_interactions[0].request.headers");
  expect_schema_error_at(
      R"({"http_interactions":[{"request":{"uri":"u","method":"get","headers":{"Accept":["a"],"Accept":["b"]}},"response":{"http_version":"1.1","status":{"code":200,"message":"OK"}},"recorded_at":"x"}],"recorded_with":"VCR"})",
      "http_interactions[0].request.headers.Accept");
  expect_schema_error_at(R"(["not","a","cassette"])", "");
}

TEST(encoding_types, unsupported_body_shapes_are_schema_errors) {
  expect_schema_error_at(document_with_request_body(R"({"form":{"a":"b"}})"),
                         "http_interactions[0].request.body");
  expect_schema_error_at(document_with_request_body(R"({"json":{},"extra":1})"),
                         "http_interactions[0].request.body");
  expect_schema_error_at(document_with_request_body(R"({"string":"abc"})"),
                         "http_interactions[0].request.body.encoding");
  expect_schema_error_at(document_with_request_body(R"(["a"])"),
                         "http_interactions[0].request.body");
  expect_schema_error_at(
      document_with_request_body(R"({"matches":[{"glob":"*.json"}]})"),
      "http_interactions[0].request.body.matches[0].glob");
  expect_schema_error_at(
      document_with_request_body(R"({"matches":[{"substring":"a","regex":"b"}]})"),
      "http_interactions[0].request.body.matches[0]");
  expect_schema_error_at(document_with_request_body(R"({"matches":"abc"})"),
                         "http_interactions[0].request.body.matches");
}

TEST(encoding_types, responses_only_carry_string_bodies) {
  expect_schema_error_at(
      R"({"http_interactions":[{"request":{"uri":"u","method":"get"},"response":{"body":{"json":{"a":1}},"http_version":"1.1","status":{"code":200,"message":"OK"}},"recorded_at":"x"}],"recorded_with":"VCR"})",
      "http_interactions[0].response.body");
}

TEST(encoding_types, disabled_capabilities_reject_their_shapes) {
  auto no_matching =
      vcr::schema::capabilities{.json = true, .matching = false, .regex = true};
  expect_schema_error_at(
      document_with_request_body(R"({"matches":[{"substring":"a"}]})"),
      "http_interactions[0].request.body", no_matching);

  auto no_json =
      vcr::schema::capabilities{.json = false, .matching = true, .regex = true};
  expect_schema_error_at(document_with_request_body(R"({"json":{"a":1}})"),
                         "http_interactions[0].request.body", no_json);

  auto no_regex =
      vcr::schema::capabilities{.json = true, .matching = true, .regex = false};
  expect_schema_error_at(
      document_with_request_body(
          R"({"matches":[{"substring":"a"},{"regex":"\\d+"}]})"),
      "http_interactions[0].request.body.matches[1].regex", no_regex);

  auto none = yaml_encoder_t{.caps = vcr::schema::capabilities::none()};
  EXPECT_NO_THROW(none.decode<vcr::schema::cassette_t>(
      vcr::testing::read_fixture("example.json")));
}

TEST(encoding_types, invalid_regex_is_rejected_at_decode) {
  expect_schema_error_at(
      document_with_request_body(R"({"matches":[{"regex":"(unclosed"}]})"),
      "http_interactions[0].request.body.matches[0].regex");
}

TEST(encoding_types, malformed_text_is_a_schema_error) {
  expect_schema_error_at(R"({"http_interactions": [)", "");
  EXPECT_FALSE(yaml_encoder_t{}
                   .try_decode<vcr::schema::cassette_t>("{\"a\": [}")
                   .has_value());
  EXPECT_FALSE(json_encoder_t{}
                   .try_decode<vcr::schema::cassette_t>(R"({"recorded_with":"VCR"})")
                   .has_value());
  EXPECT_TRUE(json_encoder_t{}
                  .try_decode<vcr::schema::cassette_t>(
                      vcr::testing::read_fixture("example.json"))
                  .has_value());
}

TEST(encoding_types, describe_renders_bodies_for_logs) {
  EXPECT_EQ(vcr::schema::describe(
                vcr::schema::body_t{vcr::schema::plain_body_t{.text = "hi"}}),
            "hi");
  EXPECT_EQ(vcr::schema::describe(vcr::schema::body_t{
                vcr::schema::encoded_body_t{.encoding = "base64",
                                            .string = "aGk="}}),
            "(base64)aGk=");
  EXPECT_EQ(vcr::schema::describe(vcr::schema::body_t{
                vcr::schema::match_list_body_t{
                    .matchers = {vcr::schema::substring_matcher_t{.needle = "foo"},
                                 vcr::schema::regex_matcher_t{.pattern = R"(\d+)"}}}}),
            R"([substring("foo"), regex("\d+")])");
  auto json = vcr::schema::describe(
      vcr::schema::body_t{vcr::schema::json_body_t{.value = parse(R"({"a":1})")}});
  EXPECT_NE(json.find("\"a\""), std::string::npos);
}
