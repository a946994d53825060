#pragma once

#include <cstdint>

namespace hufzip {

// Bit accounting for one encode or decode call.
struct CodecStats {
    uint64_t raw_bytes{0};        // uncompressed size
    uint64_t compressed_bytes{0}; // .hz size incl. padding
    uint64_t header_bits{0};      // magic + tree header
    uint64_t body_bits{0};        // symbol codes incl. EOF code
    int used_symbols{0};          // leaves in the tree, EOF included
};

} // namespace hufzip
