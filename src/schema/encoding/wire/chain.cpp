#include <wormhole/common/critical.hpp>
#include <wormhole/schema/encoding/wire/chain.hpp>

#include <array>
#include <iterator>

#include <boost/endian/conversion.hpp>

namespace wormhole::schema::encoding::wire {

void write_chain(const chain_t& value, bytes_t& out) {
  auto buffer = std::array<uint8_t, kChainSize>{};
  boost::endian::store_big_u16(buffer.data(), to_u16(value));
  out.insert(std::end(out), std::begin(buffer), std::end(buffer));
}

std::optional<chain_t> try_read_chain(const bytes_view_t& bytes) {
  if (bytes.size() < kChainSize) {
    return std::nullopt;
  }
  return from_u16(boost::endian::load_big_u16(bytes.data()));
}

chain_t read_chain(const bytes_view_t& bytes) {
  auto chain = try_read_chain(bytes);
  if (!chain) {
    wormhole::common::critical("wire chain id needs {} bytes, got {}",
                               kChainSize, bytes.size());
  }
  return *chain;
}

}  // namespace wormhole::schema::encoding::wire
