#pragma once
#include <ostream>
#include <string_view>
#include <wormhole/schema/chain.hpp>

#include <spdlog/fmt/fmt.h>

namespace wormhole::schema {

inline std::ostream& operator<<(std::ostream& os, const chain_t& value) {
  return os << to_string(value);
}

}  // namespace wormhole::schema

// Lets chain_t go straight into spdlog/fmt calls.
template <>
struct fmt::formatter<wormhole::schema::chain_t>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const wormhole::schema::chain_t& value,
              FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        wormhole::schema::to_string(value), ctx);
  }
};
