#include "chunker.hpp"
#include "chunk_store.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include <chrono>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Matches "<stem>.partNNNNNN.<raw|gz|zst>".
bool is_chunk_file_of(const std::string& name, const std::string& stem) {
    const std::string prefix = stem + ".part";
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) return false;

    size_t pos = prefix.size();
    size_t digits = 0;
    while (pos < name.size() && std::isdigit(static_cast<unsigned char>(name[pos]))) {
        ++pos;
        ++digits;
    }
    if (digits < static_cast<size_t>(CHUNK_INDEX_WIDTH) || pos >= name.size() || name[pos] != '.') return false;

    std::string suffix = name.substr(pos + 1);
    return suffix == "raw" || suffix == "gz" || suffix == "zst";
}

std::vector<fs::path> existing_store_files(const fs::path& dir, const std::string& stem) {
    std::vector<fs::path> found;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return found;

    for (const auto& item : fs::directory_iterator(dir)) {
        if (!item.is_regular_file()) continue;
        std::string name = item.path().filename().string();
        if (name == MANIFEST_NAME || is_chunk_file_of(name, stem)) {
            found.push_back(item.path());
        }
    }
    return found;
}

// Deletes every chunk file of an unfinished run when destroyed.
class PartialStoreCleaner {
public:
    PartialStoreCleaner() = default;
    PartialStoreCleaner(const PartialStoreCleaner&) = delete;
    PartialStoreCleaner& operator=(const PartialStoreCleaner&) = delete;

    ~PartialStoreCleaner() {
        if (committed) return;
        for (const auto& p : written) {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    void track(fs::path p) { written.push_back(std::move(p)); }
    void commit() { committed = true; }

private:
    std::vector<fs::path> written;
    bool committed = false;
};

} // namespace

void ChunkOptions::validate() const {
    if (chunk_size == 0) {
        throw InvalidParameters("Chunk size must be positive");
    }
    if (chunk_size > std::numeric_limits<uint32_t>::max()) {
        throw InvalidParameters("Chunk size must not exceed " + std::to_string(std::numeric_limits<uint32_t>::max()) + " bytes");
    }
    if (level < MIN_LEVEL || level > MAX_LEVEL) {
        throw InvalidParameters("Compression level must be between 1 and 9, got " + std::to_string(level));
    }
    if (!(min_gain >= 0.0 && min_gain < 1.0)) {
        throw InvalidParameters("Min gain must be in [0, 1), got " + std::to_string(min_gain));
    }
}

fs::path default_chunk_dir(const fs::path& source) {
    return source.parent_path() / (std::string(CHUNK_DIR_PREFIX) + source.stem().string());
}

ChunkResult chunk_file(const fs::path& source, const ChunkOptions& options) {
    options.validate();

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw SourceNotFound(source.string());
    }

    const std::string stem = source.stem().string();
    const fs::path dir = options.out_dir.value_or(default_chunk_dir(source));

    if (!options.quiet) {
        std::cout << "Chunking " << source.string() << " into " << dir.string() << "..." << std::endl;
    }

    try {
        fs::create_directories(dir);
        auto previous = existing_store_files(dir, stem);
        if (!previous.empty()) {
            if (!options.overwrite) {
                throw OutputExists("Chunk directory " + dir.string() + " already holds a store for '" + stem +
                                   "'. Use --force to replace it.");
            }
            if (!options.quiet) {
                std::cout << "  Removing " << previous.size() << " file(s) of the previous store..." << std::endl;
            }
            for (const auto& p : previous) {
                fs::remove(p);
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw IOError("Failed to prepare chunk directory " + dir.string() + ": " + e.what());
    }

    std::ifstream in_file(source, std::ios::binary);
    if (!in_file) {
        throw IOError("Cannot open file " + source.string());
    }

    ChunkStore store(dir, stem);
    PartialStoreCleaner cleaner;
    Sha256 file_hasher;

    Manifest mf;
    mf.source_name = source.filename().string();
    mf.chunk_size = options.chunk_size;
    mf.compression_level = options.level;
    mf.min_gain = options.min_gain;
    mf.codec = options.codec;
    mf.created_at_unix = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    Bytes window(static_cast<size_t>(options.chunk_size));
    uint64_t index = 0;
    while (true) {
        in_file.read(reinterpret_cast<char*>(window.data()), static_cast<std::streamsize>(window.size()));
        std::streamsize got = in_file.gcount();
        if (in_file.bad()) {
            throw IOError("Failed to read from " + source.string());
        }
        if (got <= 0) break;
        if (index > std::numeric_limits<uint32_t>::max()) {
            throw InvalidParameters("Too many chunks for chunk size " + std::to_string(options.chunk_size));
        }

        Bytes raw(window.begin(), window.begin() + got);
        file_hasher.update(raw);

        ChunkEntry entry = store.store_chunk(raw, static_cast<uint32_t>(index), options.level, options.min_gain, options.codec);
        cleaner.track(store.chunk_path(entry));

        if (!options.quiet) {
            std::cout << "  chunk " << entry.index << ": " << entry.original_size << " -> " << entry.stored_size
                      << " bytes (" << form_to_string(entry.form) << ")" << std::endl;
        }

        mf.source_size += entry.original_size;
        mf.stored_size_total += entry.stored_size;
        mf.chunks.push_back(std::move(entry));
        ++index;

        if (in_file.eof()) break;
    }

    mf.source_hash = file_hasher.hex_digest();
    write_manifest(mf, manifest_path(dir));
    cleaner.commit();

    if (!options.quiet) {
        std::cout << "Done. " << mf.chunks.size() << " chunk(s), " << format_size(mf.source_size)
                  << " -> " << format_size(mf.stored_size_total) << std::endl;
        std::cout << "Manifest saved to " << manifest_path(dir).string() << std::endl;
    }
    return ChunkResult{dir, std::move(mf)};
}
