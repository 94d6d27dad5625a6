#pragma once

namespace wormhole::schema::encoding {

// Structured codec selected at build time by tag, e.g.
// encoder<scale_encoder_tag>. Each codec header provides the
// specialization with encode, decode and try_decode.
template <typename Library>
struct encoder;

}  // namespace wormhole::schema::encoding
