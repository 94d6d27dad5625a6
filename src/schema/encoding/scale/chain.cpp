#include <wormhole/schema/encoding/scale/chain.hpp>
#include <scale/scale.hpp>

namespace wormhole::schema {

void encode(const chain_t& o, ::scale::Encoder& encoder) {
  encode(to_u16(o), encoder);
}

void decode(chain_t& o, ::scale::Decoder& decoder) {
  auto id = uint16_t{};
  decode(id, decoder);
  o = from_u16(id);
}

}  // namespace wormhole::schema
