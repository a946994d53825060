#pragma once

#include <cstdint>
#include <vector>

#include "codec/codec_stats.hpp"
#include "codec/status.hpp"

namespace hufzip {

class BitReader;
class BitWriter;

// Check magic, rebuild the tree, then walk it one bit at a time until the EOF
// leaf. Bits after the EOF code are ignored.
Status decode_stream(BitReader& in, BitWriter& out, CodecStats* stats = nullptr);

// Decode .hz bytes. output is only assigned when the result is Status::Ok.
Status decode_bytes(const std::vector<uint8_t>& input,
                    std::vector<uint8_t>& output,
                    CodecStats* stats = nullptr);

} // namespace hufzip
