#pragma once
#include <iterator>
#include <utility>
#include <optional>
#include <scale/scale.hpp>
#include <wormhole/common/critical.hpp>
#include <wormhole/schema/encoding/encoder.hpp>
#include <wormhole/schema/encoding/scale/chain.hpp>
#include <wormhole/schema/primitives.hpp>

namespace wormhole::schema::encoding {

struct scale_encoder_tag {};

// SCALE through scale-codec-cpp's in-memory encoder. encode and decode
// treat codec failure as fatal; try_decode reports it as nullopt.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      wormhole::common::critical("failed to encode SCALE object");
    }
    return std::move(encoded.value());
  }

  // Appends to out, for building a payload field by field.
  template <typename T>
  void encode(const T& obj, bytes_t& out) {
    auto encoded = encode(obj);
    out.insert(std::end(out), std::begin(encoded), std::end(encoded));
  }

  template <typename T>
  std::optional<T> try_decode(const bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }

  template <typename T>
  T decode(const bytes_view_t& bytes) {
    auto decoded = try_decode<T>(bytes);
    if (!decoded) {
      wormhole::common::critical("failed to decode {} SCALE bytes",
                                 bytes.size());
    }
    return std::move(*decoded);
  }
};

}  // namespace wormhole::schema::encoding
