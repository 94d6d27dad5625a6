#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <wormhole/schema/enum_string.hpp>

// Schema type: chain.
// Identifies the network a message originates from or is addressed to. The
// numeric form is a u16; every u16 maps to exactly one chain_t and back.
namespace wormhole::schema {

struct any_chain;
struct solana_chain;
class unknown_chain;

using chain_t = std::variant<any_chain, solana_chain, unknown_chain>;

// The only way to build an unknown_chain. 0 and 1 always collapse to
// any_chain and solana_chain.
chain_t from_u16(const uint16_t value);
uint16_t to_u16(const chain_t& value);

// In the wire format 0 marks a message for any destination chain.
struct any_chain final {
  static constexpr uint16_t kId = 0;
  auto operator<=>(const any_chain&) const = default;
};

struct solana_chain final {
  static constexpr uint16_t kId = 1;
  auto operator<=>(const solana_chain&) const = default;
};

// Chain without a named alternative yet. Holds any id other than the named
// ones.
class unknown_chain final {
 public:
  constexpr uint16_t id() const { return id_; }
  auto operator<=>(const unknown_chain&) const = default;

 private:
  constexpr explicit unknown_chain(const uint16_t id) : id_{id} {}
  friend chain_t from_u16(const uint16_t value);

  uint16_t id_;
};

inline constexpr auto kNamedChainMappings = std::array{
    std::pair<std::string_view, chain_t>{"Any", chain_t{any_chain{}}},
    std::pair<std::string_view, chain_t>{"Solana", chain_t{solana_chain{}}},
};

inline constexpr std::string_view kUnknownChainName = "Unknown";

// Raised by parse_chain. input() is the rejected text, unmodified.
class invalid_chain_error final : public std::invalid_argument {
 public:
  explicit invalid_chain_error(std::string input);

  const std::string& input() const noexcept { return input_; }

 private:
  std::string input_;
};

// Decimal chain id: optional leading '+', ASCII digits, at most 65535. No
// whitespace and no '-'.
std::optional<uint16_t> try_parse_chain_id(const std::string_view value);

// "Any", "Solana" or "Unknown(<decimal>)".
std::string to_string(const chain_t& value);

template <>
std::optional<chain_t> try_from_string<chain_t>(const std::string_view value);

// Keywords match ignoring ASCII case. Throws invalid_chain_error.
chain_t parse_chain(const std::string_view value);

}  // namespace wormhole::schema

template <>
struct std::hash<wormhole::schema::any_chain> {
  std::size_t operator()(const wormhole::schema::any_chain&) const noexcept {
    return std::hash<uint16_t>{}(wormhole::schema::any_chain::kId);
  }
};

template <>
struct std::hash<wormhole::schema::solana_chain> {
  std::size_t operator()(
      const wormhole::schema::solana_chain&) const noexcept {
    return std::hash<uint16_t>{}(wormhole::schema::solana_chain::kId);
  }
};

template <>
struct std::hash<wormhole::schema::unknown_chain> {
  std::size_t operator()(
      const wormhole::schema::unknown_chain& value) const noexcept {
    return std::hash<uint16_t>{}(value.id());
  }
};
