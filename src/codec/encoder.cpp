#include "codec/encoder.hpp"

#include "format/hz_format.hpp"

#include "entropy/bitstream.hpp"
#include "entropy/code_table.hpp"
#include "entropy/code_tree.hpp"
#include "entropy/frequency.hpp"
#include "entropy/tree_header.hpp"

#include <cstdio>

namespace hufzip {

void encode_stream(BitReader& in, BitWriter& out, CodecStats* stats) {
    //===Pass 1: count===//
    const FrequencyTable freq = collect_frequencies(in);

    //===Tree + codes===//
    NodePtr root = build_code_tree(freq);
    const CodeTable table = derive_code_table(*root);

#ifndef NDEBUG
    std::fprintf(stderr, "Huffman codes (first 10 used symbols):\n");
    int count = 0;
    for (int s = 0; s < kSymbolCount && count < 10; ++s) {
        if (!table[s].valid) continue;
        std::fprintf(stderr, "sym=%d freq=%llu code=%s\n", s,
                     static_cast<unsigned long long>(freq[s]),
                     code_to_string(table[s]).c_str());
        ++count;
    }
#endif

    //===Header===//
    const uint64_t start_bits = out.bits_written();
    out.write_bits(kHzMagic, kMagicBits);
    write_tree_header(*root, out);
    const uint64_t header_end = out.bits_written();

    //===Pass 2: body===//
    in.reset();
    uint64_t raw_bytes = 0;
    uint32_t word = 0;
    while (in.read_bits(kBitsPerByte, word)) {
        write_code(out, table[word]);
        ++raw_bytes;
    }
    write_code(out, table[kEofSymbol]);
    const uint64_t body_end = out.bits_written();
    out.flush();

#ifndef NDEBUG
    std::fprintf(stderr, "encode: header_bits=%llu body_bits=%llu\n",
                 static_cast<unsigned long long>(header_end - start_bits),
                 static_cast<unsigned long long>(body_end - header_end));
#endif

    if (stats) {
        stats->raw_bytes = raw_bytes;
        stats->header_bits = header_end - start_bits;
        stats->body_bits = body_end - header_end;
        stats->compressed_bytes = (body_end - start_bits + 7) / 8;
        stats->used_symbols = used_symbol_count(freq);
    }
}

std::vector<uint8_t> encode_bytes(const std::vector<uint8_t>& input, CodecStats* stats) {
    BitReader r(input);
    BitWriter w;
    encode_stream(r, w, stats);
    return w.data();
}

} // namespace hufzip
