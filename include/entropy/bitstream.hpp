#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hufzip {

// MSB-first bit packer into an in-memory buffer.
class BitWriter {
public:
    // Write the low bit_len bits of value (0..32). bit_len == 0 writes nothing.
    void write_bits(uint32_t value, int bit_len);
    void write_bit(bool bit);

    // Pad the partial byte with zeros. Safe to call more than once.
    void flush();

    const std::vector<uint8_t>& data() const { return data_; }
    uint64_t bits_written() const { return bits_written_; }

private:
    std::vector<uint8_t> data_;
    uint8_t cur_{0};
    uint8_t bit_pos_{0}; // bits filled in cur_ (0..7)
    uint64_t bits_written_{0};
};

// MSB-first bit reader over a byte buffer that must outlive the reader.
// End of input is reported by a false return, never by an exception.
class BitReader {
public:
    explicit BitReader(const std::vector<uint8_t>& buf)
        : data_(buf) {}
    // The buffer is held by reference, so temporaries are rejected.
    explicit BitReader(std::vector<uint8_t>&&) = delete;

    // Reads bit_len bits (0..32) into value. Returns false, consuming nothing,
    // when fewer than bit_len bits remain.
    bool read_bits(int bit_len, uint32_t& value);
    bool read_bit(bool& bit);

    // Restart from the first bit of the buffer.
    void reset();

    uint64_t bits_read() const { return bits_read_; }
    uint64_t bits_remaining() const;

private:
    const std::vector<uint8_t>& data_;
    size_t byte_idx_{0};
    uint8_t bit_pos_{0};
    uint64_t bits_read_{0};
};

} // namespace hufzip
