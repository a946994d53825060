#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hufzip {

// Read the whole file into memory. Works on non-seekable sources (pipes,
// /dev/stdin, FIFOs), which gives the encoder a restartable copy of its input.
// Throws std::runtime_error if the file cannot be opened or read.
std::vector<uint8_t> read_file(const std::string& path);

// Throws std::runtime_error if the file cannot be created or fully written.
void write_file(const std::string& path, const std::vector<uint8_t>& bytes);

} // namespace hufzip
