#pragma once

#include <string>
#include <vector>

#include "entropy/code_tree.hpp"

namespace hufzip {

class BitWriter;

struct CodeEntry {
    std::vector<bool> bits; // root-to-leaf path, false = left
    bool valid{false};
};

// Indexed by symbol, always kSymbolCount entries. Only leaves of the tree
// are valid.
using CodeTable = std::vector<CodeEntry>;

// A leaf root gets the empty (zero-length) code.
CodeTable derive_code_table(const CodeNode& root);

void write_code(BitWriter& w, const CodeEntry& e);

// "0110"-style rendering for diagnostics.
std::string code_to_string(const CodeEntry& e);

} // namespace hufzip
