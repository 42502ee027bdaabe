#include <boost/program_options.hpp>
#include <nhs_number/common/critical.hpp>
#include <nhs_number/schema/checksum.hpp>
#include <nhs_number/schema/encoding/nhs_number.hpp>
#include <nhs_number/schema/encoding/scale/encoder.hpp>
#include <nhs_number/schema/nhs_number.hpp>
#include <nhs_number/schema/parser.hpp>
#include <nhs_number/schema/testable.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

namespace {

using encoder_t = nhs_number::schema::encoding::encoder<
    nhs_number::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

constexpr int kExitOk = 0;
constexpr int kExitParseError = 1;
constexpr int kExitInvalidCheckDigit = 2;

// Upper bound on redraws per --valid-only sample.
constexpr uint32_t kMaxSampleAttempts = 1000;

void configure_logging(const std::string& level) {
  auto logger = spdlog::stderr_color_mt("nhs_number");
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_default_logger(logger);
  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    nhs_number::common::critical("unsupported log level '{}'", level);
  }
  spdlog::set_level(parsed);
}

std::string require_input(const po::variables_map& vm,
                          const std::string& command) {
  if (!vm.contains("input")) {
    nhs_number::common::critical("{} requires an input argument", command);
  }
  return vm["input"].as<std::string>();
}

std::optional<nhs_number::schema::nhs_number_t> parse_or_report(
    const std::string& input) {
  auto result = nhs_number::schema::parse_nhs_number(input);
  return std::visit(
      overloaded{
          [](const nhs_number::schema::nhs_number_t& value)
              -> std::optional<nhs_number::schema::nhs_number_t> {
            spdlog::debug("Parsed '{}'", nhs_number::schema::to_string(value));
            return value;
          },
          [&](const nhs_number::schema::parse_error_t& error)
              -> std::optional<nhs_number::schema::nhs_number_t> {
            spdlog::debug("Rejected input '{}'", input);
            std::cerr << nhs_number::schema::to_string(error.code)
                      << " at position " << error.position << '\n';
            return std::nullopt;
          }},
      result);
}

int run_validate(const std::string& input) {
  auto value = parse_or_report(input);
  if (!value) {
    return kExitParseError;
  }
  auto valid = value->validate_check_digit();
  std::cout << *value << ' ' << (valid ? "valid" : "invalid") << '\n';
  return valid ? kExitOk : kExitInvalidCheckDigit;
}

int run_format(const std::string& input) {
  auto value = parse_or_report(input);
  if (!value) {
    return kExitParseError;
  }
  std::cout << *value << '\n';
  return kExitOk;
}

int run_check_digit(const std::string& input) {
  auto value = parse_or_report(input);
  if (!value) {
    return kExitParseError;
  }
  if (!nhs_number::schema::is_check_digit_representable(value->digits)) {
    spdlog::warn("Checksum for {} is 10; the number cannot be issued",
                 nhs_number::schema::to_string(*value));
  }
  std::cout << static_cast<int>(value->calculate_check_digit()) << '\n';
  return kExitOk;
}

nhs_number::schema::nhs_number_t draw_sample(const bool valid_only) {
  for (uint32_t attempt = 0; attempt < kMaxSampleAttempts; ++attempt) {
    auto sample = nhs_number::schema::testable_random_sample();
    if (!valid_only || sample.validate_check_digit()) {
      return sample;
    }
  }
  nhs_number::common::critical("no valid sample after {} attempts",
                               kMaxSampleAttempts);
}

int run_sample(const int64_t count, const bool valid_only) {
  if (count < 0) {
    std::cerr << "--count must not be negative, got " << count << '\n';
    return kExitParseError;
  }
  spdlog::info("Drawing {} sample(s) from the testable range", count);
  for (int64_t i = 0; i < count; ++i) {
    std::cout << draw_sample(valid_only) << '\n';
  }
  return kExitOk;
}

int run_encode(const std::string& input) {
  auto value = parse_or_report(input);
  if (!value) {
    return kExitParseError;
  }
  auto encoded = encoder_t{}.encode(*value);
  std::cout << nhs_number::schema::to_hex(
                   nhs_number::schema::make_bytes_view(encoded))
            << '\n';
  return kExitOk;
}

int run_decode(const std::string& input) {
  auto bytes = nhs_number::schema::try_from_hex(input);
  if (!bytes) {
    std::cerr << "invalid hex input\n";
    return kExitParseError;
  }
  auto encoder = encoder_t{};
  auto value = nhs_number::schema::encoding::try_decode_nhs_number(
      encoder, nhs_number::schema::make_bytes_view(*bytes));
  if (!value) {
    std::cerr << "invalid SCALE encoded NHS number\n";
    return kExitParseError;
  }
  std::cout << *value << '\n';
  return kExitOk;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  nhs_number_tool validate <input>\n"
            << "  nhs_number_tool format <input>\n"
            << "  nhs_number_tool check-digit <input>\n"
            << "  nhs_number_tool sample [--count N] [--valid-only]\n"
            << "  nhs_number_tool encode <input>\n"
            << "  nhs_number_tool decode <hex>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto log_level = std::string{};
  auto options = po::options_description{"nhs_number_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "validate|format|check-digit|sample|encode|decode")(
      "input", po::value<std::string>(), "NHS number text or SCALE hex")(
      "count", po::value<int64_t>()->default_value(1),
      "number of samples to draw")("valid-only",
                                   "only emit samples whose check digit "
                                   "validates")(
      "log-level", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|error|critical|off");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  positional.add("input", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    print_help(options);
    return kExitParseError;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return kExitOk;
  }

  configure_logging(log_level);

  auto exit_code = kExitOk;
  if (command == "validate") {
    exit_code = run_validate(require_input(vm, command));
  } else if (command == "format") {
    exit_code = run_format(require_input(vm, command));
  } else if (command == "check-digit") {
    exit_code = run_check_digit(require_input(vm, command));
  } else if (command == "sample") {
    exit_code =
        run_sample(vm["count"].as<int64_t>(), vm.contains("valid-only"));
  } else if (command == "encode") {
    exit_code = run_encode(require_input(vm, command));
  } else if (command == "decode") {
    exit_code = run_decode(require_input(vm, command));
  } else {
    nhs_number::common::critical(
        "command must be validate|format|check-digit|sample|encode|decode");
  }

  spdlog::shutdown();
  return exit_code;
}
