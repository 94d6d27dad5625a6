#include <boost/program_options.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>
#include <wormhole/schema/chain.hpp>
#include <wormhole/schema/chain_format.hpp>
#include <wormhole/schema/encoding/scale/encoder.hpp>
#include <wormhole/schema/encoding/wire/chain.hpp>
#include <wormhole/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

using encoder_t = wormhole::schema::encoding::encoder<
    wormhole::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

constexpr auto kExitInvalidInput = 1;
constexpr auto kExitUsage = 2;

constexpr auto kInputOptions =
    std::array<std::string_view, 4>{"text", "id", "scale", "wire"};

std::optional<wormhole::schema::bytes_t> read_exact_hex(
    const std::string& hex,
    const std::string_view option) {
  auto bytes = wormhole::schema::try_from_hex(hex);
  if (!bytes) {
    spdlog::error("--{} is not valid hex: '{}'", option, hex);
    return std::nullopt;
  }
  if (bytes->size() != wormhole::schema::encoding::wire::kChainSize) {
    spdlog::error("--{} expects {} bytes, got {}", option,
                  wormhole::schema::encoding::wire::kChainSize, bytes->size());
    return std::nullopt;
  }
  return bytes;
}

std::optional<wormhole::schema::chain_t> read_chain(
    const po::variables_map& vm) {
  if (vm.contains("text")) {
    const auto& text = vm["text"].as<std::string>();
    auto chain = wormhole::schema::try_from_string<wormhole::schema::chain_t>(
        text);
    if (!chain) {
      spdlog::error("{}", wormhole::schema::invalid_chain_error{text}.what());
    }
    return chain;
  }

  if (vm.contains("id")) {
    const auto& text = vm["id"].as<std::string>();
    auto id = wormhole::schema::try_parse_chain_id(text);
    if (!id) {
      spdlog::error("--id '{}' is not a chain id in 0-65535", text);
      return std::nullopt;
    }
    return wormhole::schema::from_u16(*id);
  }

  if (vm.contains("scale")) {
    auto bytes = read_exact_hex(vm["scale"].as<std::string>(), "scale");
    if (!bytes) {
      return std::nullopt;
    }
    auto encoder = encoder_t{};
    auto chain = encoder.try_decode<wormhole::schema::chain_t>(
        wormhole::schema::make_bytes_view(*bytes));
    if (!chain) {
      spdlog::error("--scale could not be decoded");
    }
    return chain;
  }

  auto bytes = read_exact_hex(vm["wire"].as<std::string>(), "wire");
  if (!bytes) {
    return std::nullopt;
  }
  return wormhole::schema::encoding::wire::try_read_chain(
      wormhole::schema::make_bytes_view(*bytes));
}

void print_chain(const wormhole::schema::chain_t& chain) {
  auto encoder = encoder_t{};
  auto wire = wormhole::schema::bytes_t{};
  wormhole::schema::encoding::wire::write_chain(chain, wire);

  std::cout << "chain=" << chain << "\n";
  std::cout << "id=" << wormhole::schema::to_u16(chain) << "\n";
  std::cout << "scale=" << wormhole::schema::to_hex(encoder.encode(chain))
            << "\n";
  std::cout << "wire=" << wormhole::schema::to_hex(wire) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto logger = spdlog::stderr_color_mt("chain_tool");
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto vm = po::variables_map{};
  auto description = po::options_description{"Chain identifier tool"};
  description.add_options()("help,h", "Show the help message")(
      "text,t", po::value<std::string>(),
      "Textual form: Any, Solana or Unknown(<id>)")(
      "id,i", po::value<std::string>(), "Numeric form, 0-65535")(
      "scale", po::value<std::string>(), "SCALE encoded hex, 2 bytes")(
      "wire", po::value<std::string>(), "Big-endian wire hex, 2 bytes")(
      "verbose,v", "Enable verbose output");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    spdlog::error("{}", ex.what());
    std::cerr << description << std::endl;
    return kExitUsage;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto inputs = 0;
  for (const auto option : kInputOptions) {
    if (vm.contains(std::string{option})) {
      ++inputs;
    }
  }
  if (inputs != 1) {
    spdlog::error("exactly one of --text, --id, --scale, --wire is required");
    std::cerr << description << std::endl;
    return kExitUsage;
  }

  auto chain = read_chain(vm);
  if (!chain) {
    return kExitInvalidInput;
  }
  spdlog::debug("resolved chain {} (id {})", *chain,
                wormhole::schema::to_u16(*chain));

  print_chain(*chain);
  spdlog::shutdown();
  return 0;
}
