#include "entropy/code_tree.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <utility>
#include <vector>

namespace hufzip {

NodePtr CodeNode::make_leaf(int symbol, uint64_t weight) {
    auto n = std::make_unique<CodeNode>();
    n->kind = Leaf{symbol, weight};
    return n;
}

NodePtr CodeNode::make_internal(NodePtr left, NodePtr right) {
    if (!left || !right) {
        throw std::invalid_argument("code tree: internal node needs two children");
    }
    auto n = std::make_unique<CodeNode>();
    const uint64_t w = left->weight() + right->weight();
    n->kind = Internal{w, std::move(left), std::move(right)};
    return n;
}

int CodeNode::symbol() const {
    if (const auto* leaf = std::get_if<Leaf>(&kind)) return leaf->symbol;
    return kNoSymbol;
}

uint64_t CodeNode::weight() const {
    if (const auto* leaf = std::get_if<Leaf>(&kind)) return leaf->weight;
    return std::get<Internal>(kind).weight;
}

namespace {

struct HeapNode {
    uint64_t weight;
    int min_symbol; // smallest symbol in subtree, for tie-break
    size_t slot;    // index into pending nodes
};

struct HeapComp {
    bool operator()(const HeapNode& a, const HeapNode& b) const {
        if (a.weight != b.weight) return a.weight > b.weight; // min-heap
        return a.min_symbol > b.min_symbol;
    }
};

} // namespace

NodePtr build_code_tree(const FrequencyTable& freq) {
    std::priority_queue<HeapNode, std::vector<HeapNode>, HeapComp> pq;
    std::vector<NodePtr> pending;
    pending.reserve(static_cast<size_t>(kSymbolCount) * 2);

    for (int s = 0; s < kSymbolCount; ++s) {
        if (freq[s] == 0) continue;
        pending.push_back(CodeNode::make_leaf(s, freq[s]));
        pq.push({freq[s], s, pending.size() - 1});
    }
    if (pq.empty()) {
        throw std::invalid_argument("code tree: all frequencies are zero");
    }

    while (pq.size() > 1) {
        HeapNode a = pq.top(); pq.pop();
        HeapNode b = pq.top(); pq.pop();
        pending.push_back(CodeNode::make_internal(std::move(pending[a.slot]),
                                                  std::move(pending[b.slot])));
        pq.push({a.weight + b.weight, std::min(a.min_symbol, b.min_symbol), pending.size() - 1});
    }
    return std::move(pending[pq.top().slot]);
}

bool same_structure(const CodeNode& a, const CodeNode& b) {
    if (a.is_leaf() || b.is_leaf()) {
        return a.is_leaf() && b.is_leaf() && a.symbol() == b.symbol();
    }
    return same_structure(a.left(), b.left()) && same_structure(a.right(), b.right());
}

int leaf_count(const CodeNode& root) {
    if (root.is_leaf()) return 1;
    return leaf_count(root.left()) + leaf_count(root.right());
}

} // namespace hufzip
