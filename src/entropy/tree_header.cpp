#include "entropy/tree_header.hpp"

#include "entropy/bitstream.hpp"

#include <utility>

namespace hufzip {

void write_tree_header(const CodeNode& root, BitWriter& w) {
    if (root.is_leaf()) {
        w.write_bit(true);
        w.write_bits(static_cast<uint32_t>(root.symbol()), kSymbolBits);
        return;
    }
    w.write_bit(false);
    write_tree_header(root.left(), w);
    write_tree_header(root.right(), w);
}

namespace {

Status read_node(BitReader& r, int depth, NodePtr& out) {
    bool bit = false;
    if (!r.read_bit(bit)) return Status::MalformedHeader;

    if (bit) {
        uint32_t sym = 0;
        if (!r.read_bits(kSymbolBits, sym)) return Status::MalformedHeader;
        if (sym > static_cast<uint32_t>(kEofSymbol)) return Status::MalformedHeader;
        out = CodeNode::make_leaf(static_cast<int>(sym), 0);
        return Status::Ok;
    }

    if (depth >= kMaxTreeDepth) return Status::MalformedHeader;
    NodePtr left;
    NodePtr right;
    Status st = read_node(r, depth + 1, left);
    if (st != Status::Ok) return st;
    st = read_node(r, depth + 1, right);
    if (st != Status::Ok) return st;
    out = CodeNode::make_internal(std::move(left), std::move(right));
    return Status::Ok;
}

} // namespace

Status read_tree_header(BitReader& r, NodePtr& root) {
    NodePtr tree;
    Status st = read_node(r, 0, tree);
    if (st == Status::Ok) root = std::move(tree);
    return st;
}

} // namespace hufzip
