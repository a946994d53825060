#include "entropy/frequency.hpp"

#include "entropy/bitstream.hpp"

namespace hufzip {

FrequencyTable collect_frequencies(BitReader& in) {
    FrequencyTable freq{};
    uint32_t word = 0;
    while (in.read_bits(kBitsPerByte, word)) {
        ++freq[word];
    }
    freq[kEofSymbol] = 1;
    return freq;
}

uint64_t total_weight(const FrequencyTable& freq) {
    uint64_t sum = 0;
    for (uint64_t f : freq) sum += f;
    return sum;
}

int used_symbol_count(const FrequencyTable& freq) {
    int n = 0;
    for (uint64_t f : freq) {
        if (f != 0) ++n;
    }
    return n;
}

} // namespace hufzip
