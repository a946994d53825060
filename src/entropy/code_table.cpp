#include "entropy/code_table.hpp"

#include "entropy/bitstream.hpp"

#include <stdexcept>
#include <utility>

namespace hufzip {

CodeTable derive_code_table(const CodeNode& root) {
    CodeTable table(static_cast<size_t>(kSymbolCount));

    // (node, path) stack; right pushed before left so left is visited first
    std::vector<std::pair<const CodeNode*, std::vector<bool>>> stack;
    stack.push_back({&root, {}});
    while (!stack.empty()) {
        auto [node, path] = std::move(stack.back());
        stack.pop_back();
        if (node->is_leaf()) {
            const int sym = node->symbol();
            if (sym < 0 || sym >= kSymbolCount) {
                throw std::runtime_error("code table: leaf symbol out of range");
            }
            table[sym].bits = std::move(path);
            table[sym].valid = true;
            continue;
        }
        std::vector<bool> right_path = path;
        right_path.push_back(true);
        path.push_back(false);
        stack.push_back({&node->right(), std::move(right_path)});
        stack.push_back({&node->left(), std::move(path)});
    }
    return table;
}

void write_code(BitWriter& w, const CodeEntry& e) {
    if (!e.valid) {
        throw std::runtime_error("huffman encode: symbol not in table");
    }
    for (bool b : e.bits) w.write_bit(b);
}

std::string code_to_string(const CodeEntry& e) {
    std::string s;
    s.reserve(e.bits.size());
    for (bool b : e.bits) s.push_back(b ? '1' : '0');
    return s;
}

} // namespace hufzip
