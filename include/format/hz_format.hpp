#pragma once

#include <cstdint>

namespace hufzip {

// .hz file layout (bit-packed, MSB-first, no byte alignment between sections):
// [magic:32][tree header][body codes...][EOF code][zero padding to byte]
//
// Tree header is a preorder walk: internal node = 0 bit, leaf = 1 bit followed
// by the leaf symbol in kSymbolBits bits.
inline constexpr uint32_t kHzMagic = 0xFACE8201u;
inline constexpr int kMagicBits = 32;

inline constexpr int kBitsPerByte = 8;
inline constexpr int kAlphabetSize = 1 << kBitsPerByte; // 256 byte values
inline constexpr int kEofSymbol = kAlphabetSize;        // pseudo-EOF sentinel
inline constexpr int kSymbolCount = kAlphabetSize + 1;  // 257 incl. EOF

// Must hold 0..256, so 8 bits is not enough.
inline constexpr int kSymbolBits = kBitsPerByte + 1;

// A Huffman tree over kSymbolCount leaves is at most kSymbolCount - 1 levels deep.
inline constexpr int kMaxTreeDepth = kSymbolCount - 1;

} // namespace hufzip
