// Batch evaluator: encode -> decode -> verify, with size metrics per file.
#include "cli/cli_parser.hpp"
#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "io/file_io.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* kUsage = "Usage: hufzip_evaluate --out <metrics.csv> [--tmp_dir <dir>] <file>...";

// RFC 4180 field: quoted when it holds a comma, quote or line break.
std::string csv_field(const std::string& v) {
    if (v.find_first_of(",\"\r\n") == std::string::npos) return v;
    std::string out = "\"";
    for (char c : v) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

int main(int argc, char** argv) {
    try {
        hufzip::CliParser cli;
        cli.parse(argc, argv);
        const std::string out_csv = cli.get("out");
        const std::string tmp_dir = cli.get("tmp_dir");
        const auto& inputs = cli.positionals();
        if (out_csv.empty() || inputs.empty()) {
            std::cerr << kUsage << "\n";
            return 1;
        }
        if (!tmp_dir.empty()) fs::create_directories(tmp_dir);

        // prepare CSV
        {
            std::ofstream ofs(out_csv, std::ios::trunc);
            if (!ofs.good()) throw std::runtime_error("Cannot write csv: " + out_csv);
            ofs << "file,raw_bytes,compressed_bytes,header_bits,body_bits,bits_per_byte,compression_ratio,roundtrip_ok\n";
        }

        int failures = 0;
        for (const std::string& path : inputs) {
            const auto raw = hufzip::read_file(path);

            // encode
            hufzip::CodecStats stats;
            const auto hz = hufzip::encode_bytes(raw, &stats);
            uint64_t compressed_bytes = hz.size();
            if (!tmp_dir.empty()) {
                const std::string hz_path = (fs::path(tmp_dir) / (fs::path(path).filename().string() + ".hz")).string();
                hufzip::write_file(hz_path, hz);
                compressed_bytes = fs::file_size(hz_path);
            }

            // rate metrics
            const double bpb = raw.empty() ? 0.0
                : static_cast<double>(stats.body_bits) / static_cast<double>(raw.size());
            const double cr = compressed_bytes > 0
                ? static_cast<double>(raw.size()) / static_cast<double>(compressed_bytes) : 0.0;

            // decode + verify
            std::vector<uint8_t> rec;
            const hufzip::Status st = hufzip::decode_bytes(hz, rec);
            const bool ok = (st == hufzip::Status::Ok) && rec == raw;
            if (!ok) {
                ++failures;
                std::cerr << "[ERROR] round trip failed for " << path;
                if (st != hufzip::Status::Ok) std::cerr << ": " << hufzip::status_message(st);
                std::cerr << "\n";
            }

            // append CSV
            {
                std::ofstream ofs(out_csv, std::ios::app);
                if (!ofs.good()) throw std::runtime_error("Cannot append csv: " + out_csv);
                ofs << csv_field(path) << ","
                    << raw.size() << ","
                    << compressed_bytes << ","
                    << stats.header_bits << ","
                    << stats.body_bits << ","
                    << bpb << ","
                    << cr << ","
                    << (ok ? 1 : 0) << "\n";
            }
        }

        std::cout << "Evaluation completed -> " << out_csv << "\n";
        return failures == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        std::cerr << kUsage << "\n";
        return 2;
    }
}
