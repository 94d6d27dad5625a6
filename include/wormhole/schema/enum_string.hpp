#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>

namespace wormhole::schema {

// Ignores ASCII case; mappings hold the canonical spelling.
template <typename Value, std::size_t N>
std::optional<Value> from_string_ignore_case(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Value>, N>& mappings) {
  for (const auto& [name, mapped] : mappings) {
    if (boost::algorithm::iequals(name, value)) {
      return mapped;
    }
  }
  return std::nullopt;
}

template <typename Value, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Value& value,
    const std::array<std::pair<std::string_view, Value>, N>& mappings) {
  for (const auto& [name, mapped] : mappings) {
    if (mapped == value) {
      return name;
    }
  }
  return std::nullopt;
}

template <typename Value>
std::optional<Value> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace wormhole::schema
