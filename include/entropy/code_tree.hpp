#pragma once

#include <cstdint>
#include <memory>
#include <variant>

#include "entropy/frequency.hpp"

namespace hufzip {

struct CodeNode;
using NodePtr = std::unique_ptr<CodeNode>;

// Huffman code tree node. A node is either a leaf carrying a symbol or an
// internal node owning exactly two children. The tree is strictly binary and
// each node is owned by its parent.
struct CodeNode {
    static constexpr int kNoSymbol = -1; // symbol() of an internal node

    struct Leaf {
        int symbol;
        uint64_t weight;
    };
    struct Internal {
        uint64_t weight;
        NodePtr left;
        NodePtr right;
    };

    std::variant<Leaf, Internal> kind;

    static NodePtr make_leaf(int symbol, uint64_t weight);
    // weight = left->weight() + right->weight()
    static NodePtr make_internal(NodePtr left, NodePtr right);

    bool is_leaf() const { return std::holds_alternative<Leaf>(kind); }
    int symbol() const;
    uint64_t weight() const;

    // Children of an internal node; std::bad_variant_access on a leaf.
    const CodeNode& left() const { return *std::get<Internal>(kind).left; }
    const CodeNode& right() const { return *std::get<Internal>(kind).right; }
};

// Classic Huffman construction: repeatedly merge the two lightest pending
// nodes (first removed becomes the left child). Equal weights are ordered by
// the smallest symbol in each subtree, so the result is deterministic.
// Throws std::invalid_argument if every count is zero.
NodePtr build_code_tree(const FrequencyTable& freq);

// Same shape and same leaf symbols; weights are ignored.
bool same_structure(const CodeNode& a, const CodeNode& b);

int leaf_count(const CodeNode& root);

} // namespace hufzip
