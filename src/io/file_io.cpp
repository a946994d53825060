#include "io/file_io.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace hufzip {

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    // no seekg/tellg: the size of a pipe is unknown until it is drained
    std::vector<uint8_t> buf{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    if (ifs.bad()) throw std::runtime_error("Cannot read file: " + path);
    return buf;
}

void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

} // namespace hufzip
