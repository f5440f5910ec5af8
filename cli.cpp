#include <iostream>
#include <string>
#include <optional>
#include <filesystem>
#include <stdexcept>

#include "chunker.hpp"
#include "rebuilder.hpp"
#include "verifier.hpp"
#include "stats.hpp"
#include "errors.hpp"
#include "cli.hpp"

namespace fs = std::filesystem;

void print_usage(const char* progName) {
    std::cerr << "Split files into conditionally compressed chunks and rebuild or verify them." << std::endl;
    std::cerr << "Usage: " << progName << " <command> [options]" << std::endl << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  chunk      Split a file into chunk files plus manifest.json." << std::endl;
    std::cerr << "  verify     Check every chunk of a chunk directory against its manifest." << std::endl;
    std::cerr << "  rebuild    Reassemble the original file from a chunk directory." << std::endl;
    std::cerr << "  stats      Summarize a chunk directory." << std::endl << std::endl;
    std::cerr << "Options for 'chunk':" << std::endl;
    std::cerr << "  " << progName << " chunk <source> [--out <dir>] [--chunk N] [--level 1-9] [--min-gain F]" << std::endl;
    std::cerr << "                    [--codec gzip|zstd] [--force]" << std::endl;
    std::cerr << "    <source>             Path to the file to split." << std::endl;
    std::cerr << "    --out <dir>          Chunk directory (default: chunks_<source stem> next to the source)." << std::endl;
    std::cerr << "    --chunk N            Chunk size in bytes (default: " << DEFAULT_CHUNK_SIZE << ")." << std::endl;
    std::cerr << "    --level 1-9          Compression level (default: " << DEFAULT_LEVEL << ")." << std::endl;
    std::cerr << "    --min-gain F         Minimum size reduction to store a chunk compressed (default: "
              << DEFAULT_MIN_GAIN << ")." << std::endl;
    std::cerr << "    --codec gzip|zstd    Compression codec (default: gzip)." << std::endl;
    std::cerr << "    --force              Replace an existing store for the same source." << std::endl << std::endl;
    std::cerr << "Options for 'verify', 'rebuild' and 'stats':" << std::endl;
    std::cerr << "  " << progName << " verify <dir>" << std::endl;
    std::cerr << "  " << progName << " rebuild <dir> --out <path>" << std::endl;
    std::cerr << "  " << progName << " stats <dir>" << std::endl << std::endl;
    std::cerr << "General Options:" << std::endl;
    std::cerr << "  -q, --quiet          Only print the final summary." << std::endl;
    std::cerr << "  -h, --help           Show this help message and exit." << std::endl;
}

namespace {

// Pulls the value following an option, or explains what is missing.
std::optional<std::string> option_value(int argc, char* argv[], int& i) {
    if (i + 1 < argc) {
        return std::string(argv[++i]);
    }
    std::cerr << "Error: " << argv[i] << " option requires an argument." << std::endl;
    return std::nullopt;
}

uint64_t parse_size(const std::string& s, const std::string& what) {
    try {
        size_t pos = 0;
        if (!s.empty() && s[0] == '-') throw std::invalid_argument(s);
        unsigned long long v = std::stoull(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw InvalidParameters("Invalid " + what + " '" + s + "'");
    }
}

int parse_int(const std::string& s, const std::string& what) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw InvalidParameters("Invalid " + what + " '" + s + "'");
    }
}

double parse_double(const std::string& s, const std::string& what) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw InvalidParameters("Invalid " + what + " '" + s + "'");
    }
}

} // namespace

int run_cli(int argc, char* argv[]) {
    // Handle help options in priority
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    if (argc < 2) {
        std::cerr << "Error: No command specified. Use 'chunk', 'verify', 'rebuild' or 'stats'." << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    bool quiet = false;
    try {
        std::string command = argv[1];

        if (command == "chunk") {
            std::string file_path;
            ChunkOptions options;

            for (int i = 2; i < argc; ++i) {
                std::string arg = argv[i];
                if (arg == "--force") {
                    options.overwrite = true;
                } else if (arg == "-q" || arg == "--quiet") {
                    quiet = true;
                } else if (arg == "--out" || arg == "--chunk" || arg == "--level" || arg == "--min-gain" || arg == "--codec") {
                    auto value = option_value(argc, argv, i);
                    if (!value) {
                        print_usage(argv[0]);
                        return 1;
                    }
                    if (arg == "--out") options.out_dir = fs::path(*value);
                    else if (arg == "--chunk") options.chunk_size = parse_size(*value, "chunk size");
                    else if (arg == "--level") options.level = parse_int(*value, "compression level");
                    else if (arg == "--min-gain") options.min_gain = parse_double(*value, "min gain");
                    else options.codec = codec_from_string(*value);
                } else {
                    if (!file_path.empty()) {
                        std::cerr << "Error: Multiple input files specified for chunk. Only one is allowed." << std::endl;
                        print_usage(argv[0]);
                        return 1;
                    }
                    file_path = arg;
                }
            }

            if (file_path.empty()) {
                std::cerr << "Error: Source file not specified for chunk command." << std::endl;
                print_usage(argv[0]);
                return 1;
            }

            options.quiet = quiet;
            ChunkResult result = chunk_file(file_path, options);
            std::cout << "OK: " << result.manifest.chunks.size() << " chunk(s) in " << result.dir.string() << std::endl;

        } else if (command == "rebuild") {
            std::string dir;
            std::optional<std::string> out_path;

            for (int i = 2; i < argc; ++i) {
                std::string arg = argv[i];
                if (arg == "-q" || arg == "--quiet") {
                    quiet = true;
                } else if (arg == "--out" || arg == "-o") {
                    out_path = option_value(argc, argv, i);
                    if (!out_path) {
                        print_usage(argv[0]);
                        return 1;
                    }
                } else if (dir.empty()) {
                    dir = arg;
                } else {
                    std::cerr << "Error: Unexpected argument '" << arg << "'." << std::endl;
                    print_usage(argv[0]);
                    return 1;
                }
            }

            if (dir.empty() || !out_path.has_value()) {
                std::cerr << "Error: rebuild requires a chunk directory and --out <path>." << std::endl;
                std::cerr << "Usage: " << argv[0] << " rebuild <dir> --out <path>" << std::endl;
                return 1;
            }

            RebuildOptions options;
            options.quiet = quiet;
            uint64_t written = rebuild_file(dir, *out_path, options);
            std::cout << "OK: rebuilt " << written << " bytes into " << *out_path << std::endl;

        } else if (command == "verify" || command == "stats") {
            std::string dir;
            for (int i = 2; i < argc; ++i) {
                std::string arg = argv[i];
                if (arg == "-q" || arg == "--quiet") {
                    quiet = true;
                } else if (dir.empty()) {
                    dir = arg;
                } else {
                    std::cerr << "Error: Unexpected argument '" << arg << "'." << std::endl;
                    print_usage(argv[0]);
                    return 1;
                }
            }

            if (dir.empty()) {
                std::cerr << "Error: " << command << " requires a chunk directory." << std::endl;
                std::cerr << "Usage: " << argv[0] << " " << command << " <dir>" << std::endl;
                return 1;
            }

            if (command == "stats") {
                StatsReport report = collect_stats(dir);
                report.print(std::cout);
                return 0;
            }

            VerifyOptions options;
            options.quiet = quiet;
            VerifyReport report = verify_store(dir, options);
            if (!report.ok()) {
                std::cout << "FAIL: " << report.source_name << ":";
                for (const auto& f : report.failures) {
                    std::cout << " " << f.index << "(" << failure_reason_to_string(f.reason) << ")";
                }
                if (report.failures.empty()) {
                    std::cout << " whole-file hash mismatch";
                }
                std::cout << std::endl;
                return EXIT_VERIFY_FAILED;
            }
            std::cout << "OK: " << report.source_name << " intact, " << report.chunks_checked << " chunk(s)" << std::endl;

        } else {
            std::cerr << "Error: Unknown command '" << command << "'. Use 'chunk', 'verify', 'rebuild' or 'stats'." << std::endl;
            print_usage(argv[0]);
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
