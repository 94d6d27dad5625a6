#include <wormhole/schema/chain.hpp>
#include <wormhole/schema/primitives.hpp>

#include <charconv>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>

namespace wormhole::schema {

namespace {

// "Unknown(<id>)" split on '(' and ')'. Segments past the id are ignored.
std::optional<chain_t> try_parse_unknown(const std::string_view value) {
  auto segments = std::vector<std::string>{};
  boost::algorithm::split(segments, value, boost::algorithm::is_any_of("()"));
  if (segments.empty() ||
      !boost::algorithm::iequals(segments[0], kUnknownChainName)) {
    return std::nullopt;
  }
  if (segments.size() < 2) {
    return std::nullopt;
  }
  auto id = try_parse_chain_id(segments[1]);
  if (!id) {
    return std::nullopt;
  }
  return from_u16(*id);
}

}  // namespace

std::optional<uint16_t> try_parse_chain_id(std::string_view digits) {
  if (!digits.empty() && digits.front() == '+') {
    digits.remove_prefix(1);
  }
  if (digits.empty() || digits.front() < '0' || digits.front() > '9') {
    return std::nullopt;
  }
  auto value = uint16_t{};
  const auto* first = digits.data();
  const auto* last = digits.data() + digits.size();
  auto [end, error] = std::from_chars(first, last, value);
  if (error != std::errc{} || end != last) {
    return std::nullopt;
  }
  return value;
}

chain_t from_u16(const uint16_t value) {
  switch (value) {
    case any_chain::kId:
      return any_chain{};
    case solana_chain::kId:
      return solana_chain{};
    default:
      return unknown_chain{value};
  }
}

uint16_t to_u16(const chain_t& value) {
  return std::visit(
      overloaded{[](const any_chain&) { return any_chain::kId; },
                 [](const solana_chain&) { return solana_chain::kId; },
                 [](const unknown_chain& o) { return o.id(); }},
      value);
}

invalid_chain_error::invalid_chain_error(std::string input)
    : std::invalid_argument{"invalid chain: " + input},
      input_{std::move(input)} {}

std::string to_string(const chain_t& value) {
  if (auto name = to_string(value, kNamedChainMappings)) {
    return std::string{*name};
  }
  return std::string{kUnknownChainName} + "(" +
         std::to_string(to_u16(value)) + ")";
}

template <>
std::optional<chain_t> try_from_string<chain_t>(const std::string_view value) {
  if (auto named = from_string_ignore_case(value, kNamedChainMappings)) {
    return named;
  }
  return try_parse_unknown(value);
}

chain_t parse_chain(const std::string_view value) {
  auto chain = try_from_string<chain_t>(value);
  if (!chain) {
    throw invalid_chain_error{std::string{value}};
  }
  return *chain;
}

}  // namespace wormhole::schema
