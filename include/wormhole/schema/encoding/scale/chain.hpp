#pragma once
#include <wormhole/schema/chain.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// SCALE form of chain_t is the bare u16 from to_u16: two bytes,
// little-endian, no variant index. Declared next to chain_t so the codec
// finds them by argument-dependent lookup ahead of its std::variant
// encoding.
namespace wormhole::schema {

void encode(const chain_t& o, ::scale::Encoder& encoder);
void decode(chain_t& o, ::scale::Decoder& decoder);

}  // namespace wormhole::schema
