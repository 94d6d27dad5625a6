#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wormhole::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

bytes_view_t make_bytes_view(const bytes_t& bytes);

// Lowercase, no prefix.
std::string to_hex(const bytes_view_t& bytes);

// Accepts an optional 0x/0X prefix and either case.
std::optional<bytes_t> try_from_hex(const std::string_view hex);

}  // namespace wormhole::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
