#include "entropy/bitstream.hpp"

#include <stdexcept>

namespace hufzip {

// ---------------- BitWriter ---------------- //
void BitWriter::write_bits(uint32_t value, int bit_len) {
    if (bit_len < 0 || bit_len > 32) {
        throw std::runtime_error("BitWriter: invalid bit length");
    }
    for (int i = bit_len - 1; i >= 0; --i) {
        write_bit(((value >> i) & 1u) != 0);
    }
}

void BitWriter::write_bit(bool bit) {
    cur_ = static_cast<uint8_t>((cur_ << 1) | (bit ? 1u : 0u));
    ++bit_pos_;
    ++bits_written_;
    if (bit_pos_ == 8) {
        data_.push_back(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

void BitWriter::flush() {
    if (bit_pos_ > 0) {
        cur_ = static_cast<uint8_t>(cur_ << (8 - bit_pos_));
        data_.push_back(cur_);
        cur_ = 0;
        bit_pos_ = 0;
    }
}

// ---------------- BitReader ---------------- //
bool BitReader::read_bits(int bit_len, uint32_t& value) {
    if (bit_len < 0 || bit_len > 32) {
        throw std::runtime_error("BitReader: invalid bit length");
    }
    if (bits_remaining() < static_cast<uint64_t>(bit_len)) {
        return false;
    }
    uint32_t v = 0;
    for (int i = 0; i < bit_len; ++i) {
        bool bit = false;
        if (!read_bit(bit)) return false;
        v = (v << 1) | (bit ? 1u : 0u);
    }
    value = v;
    return true;
}

bool BitReader::read_bit(bool& bit) {
    if (byte_idx_ >= data_.size()) {
        return false;
    }
    const uint8_t byte = data_[byte_idx_];
    bit = ((byte >> (7 - bit_pos_)) & 1u) != 0;
    ++bit_pos_;
    ++bits_read_;
    if (bit_pos_ == 8) {
        bit_pos_ = 0;
        ++byte_idx_;
    }
    return true;
}

void BitReader::reset() {
    byte_idx_ = 0;
    bit_pos_ = 0;
    bits_read_ = 0;
}

uint64_t BitReader::bits_remaining() const {
    return static_cast<uint64_t>(data_.size()) * 8u - bits_read_;
}

} // namespace hufzip
