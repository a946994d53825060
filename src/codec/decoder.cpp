#include "codec/decoder.hpp"

#include "format/hz_format.hpp"

#include "entropy/bitstream.hpp"
#include "entropy/code_tree.hpp"
#include "entropy/tree_header.hpp"

#include <cstdio>

namespace hufzip {

Status decode_stream(BitReader& in, BitWriter& out, CodecStats* stats) {
    const uint64_t start_bits = in.bits_read();

    uint32_t magic = 0;
    if (!in.read_bits(kMagicBits, magic) || magic != kHzMagic) {
        return Status::BadMagic;
    }

    NodePtr root;
    Status st = read_tree_header(in, root);
    if (st != Status::Ok) return st;
    const uint64_t header_end = in.bits_read();

    // A lone byte leaf never reaches EOF.
    if (root->is_leaf() && root->symbol() != kEofSymbol) {
        return Status::MalformedHeader;
    }

    uint64_t raw_bytes = 0;
    const CodeNode* node = root.get();
    while (true) {
        // leaf check first: a leaf root must not try to follow a child
        if (node->is_leaf()) {
            if (node->symbol() == kEofSymbol) break;
            out.write_bits(static_cast<uint32_t>(node->symbol()), kBitsPerByte);
            ++raw_bytes;
            node = root.get();
            continue;
        }
        bool bit = false;
        if (!in.read_bit(bit)) {
            return Status::TruncatedStream;
        }
        node = bit ? &node->right() : &node->left();
    }
    const uint64_t body_end = in.bits_read();
    out.flush();

#ifndef NDEBUG
    std::fprintf(stderr, "decode: header_bits=%llu body_bits=%llu bytes=%llu\n",
                 static_cast<unsigned long long>(header_end - start_bits),
                 static_cast<unsigned long long>(body_end - header_end),
                 static_cast<unsigned long long>(raw_bytes));
#endif

    if (stats) {
        stats->raw_bytes = raw_bytes;
        stats->header_bits = header_end - start_bits;
        stats->body_bits = body_end - header_end;
        stats->compressed_bytes = (body_end - start_bits + 7) / 8;
        stats->used_symbols = leaf_count(*root);
    }
    return Status::Ok;
}

Status decode_bytes(const std::vector<uint8_t>& input,
                    std::vector<uint8_t>& output,
                    CodecStats* stats) {
    BitReader r(input);
    BitWriter w;
    Status st = decode_stream(r, w, stats);
    if (st != Status::Ok) return st;
    if (stats) stats->compressed_bytes = input.size();
    output = w.data();
    return Status::Ok;
}

} // namespace hufzip
