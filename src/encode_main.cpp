#include "cli/cli_parser.hpp"
#include "io/file_io.hpp"
#include "codec/encoder.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    try {
        hufzip::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cout << "Usage: hufzip_encode --in <input> --out <output.hz> [--verbose]\n";
            return 1;
        }

        auto raw = hufzip::read_file(in);
        hufzip::CodecStats stats;
        auto bytes = hufzip::encode_bytes(raw, &stats);
        hufzip::write_file(out, bytes);

        std::cout << "input file size: " << raw.size() << " bytes\n";
        std::cout << "Wrote: " << out << " (" << bytes.size() << " bytes)\n";
        if (cli.get_flag("verbose")) {
            std::cout << "symbols used: " << stats.used_symbols << "\n"
                      << "header bits: " << stats.header_bits << "\n"
                      << "body bits: " << stats.body_bits << "\n";
            if (!raw.empty()) {
                std::cout << "bits per byte: "
                          << static_cast<double>(stats.body_bits) / static_cast<double>(raw.size())
                          << "\n";
            }
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
