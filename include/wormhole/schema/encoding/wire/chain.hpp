#pragma once
#include <cstddef>
#include <optional>
#include <wormhole/schema/chain.hpp>
#include <wormhole/schema/primitives.hpp>

// Chain id as framed inside binary message payloads: u16, big-endian.
namespace wormhole::schema::encoding::wire {

inline constexpr std::size_t kChainSize = 2;

void write_chain(const chain_t& value, bytes_t& out);

// Reads the leading kChainSize bytes; anything after them is left to the
// caller.
std::optional<chain_t> try_read_chain(const bytes_view_t& bytes);
chain_t read_chain(const bytes_view_t& bytes);

}  // namespace wormhole::schema::encoding::wire
