#pragma once

#include "codec/status.hpp"
#include "entropy/code_tree.hpp"

namespace hufzip {

class BitReader;
class BitWriter;

// Preorder: internal node -> 0, then left subtree, then right subtree;
// leaf -> 1 followed by the symbol in kSymbolBits bits.
void write_tree_header(const CodeNode& root, BitWriter& w);

// Inverse of write_tree_header. Rebuilt nodes carry weight 0.
// MalformedHeader if the input ends mid-tree, a symbol exceeds kEofSymbol, or
// nesting exceeds kMaxTreeDepth. root is left untouched on failure.
Status read_tree_header(BitReader& r, NodePtr& root);

} // namespace hufzip
