#include "cli/cli_parser.hpp"
#include "io/file_io.hpp"
#include "codec/decoder.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
    try {
        hufzip::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cerr << "Usage: hufzip_decode --in <input.hz> --out <output> [--verbose]\n";
            return 1;
        }

        auto bytes = hufzip::read_file(in);
        std::vector<uint8_t> raw;
        hufzip::CodecStats stats;
        const hufzip::Status st = hufzip::decode_bytes(bytes, raw, &stats);
        if (st != hufzip::Status::Ok) {
            std::cerr << "[ERROR] " << hufzip::status_message(st) << "\n";
            return 3;
        }
        hufzip::write_file(out, raw);
        std::cout << "Wrote: " << out << " (" << raw.size() << " bytes)\n";
        if (cli.get_flag("verbose")) {
            std::cout << "symbols used: " << stats.used_symbols << "\n"
                      << "header bits: " << stats.header_bits << "\n"
                      << "body bits: " << stats.body_bits << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
