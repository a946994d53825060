#pragma once

#include <cstdint>
#include <vector>

#include "codec/codec_stats.hpp"

namespace hufzip {

class BitReader;
class BitWriter;

// Two passes over in: count, then emit magic, tree header, one code per byte
// and the EOF code. in is reset() between passes; out is flushed at the end.
void encode_stream(BitReader& in, BitWriter& out, CodecStats* stats = nullptr);

// Encode a byte buffer to .hz bytes.
std::vector<uint8_t> encode_bytes(const std::vector<uint8_t>& input, CodecStats* stats = nullptr);

} // namespace hufzip
