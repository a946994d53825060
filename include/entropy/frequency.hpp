#pragma once

#include <array>
#include <cstdint>

#include "format/hz_format.hpp"

namespace hufzip {

class BitReader;

// counts[s] for s in 0..kEofSymbol.
using FrequencyTable = std::array<uint64_t, kSymbolCount>;

// Count every 8-bit word until the reader is exhausted. counts[kEofSymbol] is
// always exactly 1 afterwards.
FrequencyTable collect_frequencies(BitReader& in);

uint64_t total_weight(const FrequencyTable& freq);
// Number of symbols with a non-zero count (EOF included).
int used_symbol_count(const FrequencyTable& freq);

} // namespace hufzip
