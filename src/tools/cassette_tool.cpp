#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <vcr/common/critical.hpp>
#include <vcr/replay/lookup.hpp>
#include <vcr/schema/cassette.hpp>
#include <vcr/schema/encoding/yaml/encoder.hpp>
#include <vcr/schema/errors.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

using yaml_encoder_t =
    vcr::schema::encoding::encoder<vcr::schema::encoding::yaml_encoder_tag>;
using json_encoder_t =
    vcr::schema::encoding::encoder<vcr::schema::encoding::json_encoder_tag>;

void print_help(const po::options_description& options) {
  std::cout << "usage: cassette_tool <validate|convert|match> [options]\n\n"
            << "  validate --input FILE\n"
            << "  convert  --input FILE --to json|yaml\n"
            << "  match    --input FILE --method M --uri U [--body TEXT]\n\n"
            << options << '\n';
}

void configure_logging(const po::variables_map& vm) {
  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (vm.contains("log-file")) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        vm["log-file"].as<std::string>(), false));
  }
  auto logger = std::make_shared<spdlog::logger>(
      "cassette_tool", std::begin(sinks), std::end(sinks));
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);
}

vcr::schema::capabilities make_capabilities(const po::variables_map& vm) {
  return vcr::schema::capabilities{.json = !vm.contains("no-json"),
                                   .matching = !vm.contains("no-matching"),
                                   .regex = !vm.contains("no-regex")};
}

std::string read_file(const std::string& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    vcr::common::critical("cannot open {}", path);
  }
  auto buffer = std::ostringstream{};
  buffer << in.rdbuf();
  return buffer.str();
}

vcr::schema::cassette_t load_cassette(const po::variables_map& vm,
                                      const vcr::schema::capabilities& caps) {
  if (!vm.contains("input")) {
    vcr::common::critical("--input is required");
  }
  const auto& path = vm["input"].as<std::string>();
  auto text = read_file(path);
  try {
    return yaml_encoder_t{.caps = caps}.decode<vcr::schema::cassette_t>(text);
  } catch (const vcr::schema::schema_error& ex) {
    vcr::common::critical("{} is not a valid cassette: {}", path, ex.what());
  }
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"cassette_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "validate|convert|match")(
      "input,i", po::value<std::string>(), "cassette file (JSON or YAML)")(
      "to", po::value<std::string>()->default_value("yaml"), "json|yaml")(
      "method", po::value<std::string>(), "request method")(
      "uri", po::value<std::string>(), "request uri")(
      "body", po::value<std::string>()->default_value(""), "request body")(
      "no-json", "disable json bodies")("no-matching",
                                        "disable match list bodies")(
      "no-regex", "disable regex matchers")("verbose,v", "debug logging")(
      "log-file", po::value<std::string>(), "also log to this file");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  configure_logging(vm);
  auto caps = make_capabilities(vm);

  if (command == "validate") {
    auto cassette = load_cassette(vm, caps);
    std::cout << "ok " << cassette.http_interactions.size()
              << " interaction(s)\n";
    spdlog::shutdown();
    return 0;
  }

  if (command == "convert") {
    auto cassette = load_cassette(vm, caps);
    const auto& to = vm["to"].as<std::string>();
    try {
      if (to == "json") {
        std::cout << json_encoder_t{}.encode(cassette) << '\n';
      } else if (to == "yaml") {
        std::cout << yaml_encoder_t{}.encode(cassette) << '\n';
      } else {
        vcr::common::critical("--to must be json|yaml");
      }
    } catch (const vcr::schema::schema_error& ex) {
      vcr::common::critical("cannot convert {}: {}",
                            vm["input"].as<std::string>(), ex.what());
    }
    spdlog::shutdown();
    return 0;
  }

  if (command == "match") {
    if (!vm.contains("method") || !vm.contains("uri")) {
      vcr::common::critical("match requires --method and --uri");
    }
    auto cassette = load_cassette(vm, caps);
    auto query = vcr::replay::request_query_t{
        .method = vm["method"].as<std::string>(),
        .uri = vm["uri"].as<std::string>(),
        .body = vm["body"].as<std::string>()};
    try {
      auto index = vcr::replay::find_interaction(cassette, query, caps);
      spdlog::shutdown();
      if (!index) {
        std::cout << "no match\n";
        return 1;
      }
      std::cout << *index << '\n';
      return 0;
    } catch (const vcr::schema::match_error& ex) {
      vcr::common::critical("cannot evaluate {}: {}", query.uri, ex.what());
    }
  }

  vcr::common::critical("command must be validate|convert|match");
}
