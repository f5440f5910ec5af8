#include "rebuilder.hpp"
#include "chunk_store.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include "manifest.hpp"
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

uint64_t rebuild_file(const fs::path& chunk_dir, const fs::path& out_path, const RebuildOptions& options) {
    Manifest mf = read_manifest(manifest_path(chunk_dir));
    ChunkStore store(chunk_dir, fs::path(mf.source_name).stem().string());

    if (!options.quiet) {
        std::cout << "Rebuilding " << mf.source_name << " (" << mf.chunks.size() << " chunks, "
                  << mf.source_size << " bytes) into " << out_path.string() << "..." << std::endl;
    }

    try {
        if (out_path.has_parent_path()) {
            fs::create_directories(out_path.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw IOError("Failed to create output directory for " + out_path.string() + ": " + e.what());
    }

    fs::path partial_path = out_path;
    partial_path += ".partial";
    ScopedFileRemover partial_guard(partial_path);

    Sha256 file_hasher;
    uint64_t bytes_written = 0;
    {
        std::ofstream out_f(partial_path, std::ios::binary | std::ios::trunc);
        if (!out_f) {
            throw IOError("Failed to open output file: " + partial_path.string());
        }

        for (const auto& c : mf.chunks) {
            Bytes raw;
            try {
                raw = store.load_chunk(c, mf.codec);
            } catch (const MissingChunkFile& e) {
                throw RebuildIncomplete("Chunk " + std::to_string(c.index) + " missing: " + e.what());
            } catch (const CorruptData& e) {
                throw RebuildIncomplete("Chunk " + std::to_string(c.index) + " corrupt: " + e.what());
            } catch (const IOError& e) {
                throw RebuildIncomplete("Chunk " + std::to_string(c.index) + " unreadable: " + e.what());
            }

            if (sha256_hex(raw) != c.hash) {
                throw RebuildIncomplete("Chunk " + std::to_string(c.index) + ": hash mismatch (" + c.file_name + ")");
            }

            out_f.write(reinterpret_cast<const char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
            if (!out_f) {
                throw IOError("Failed to write to " + partial_path.string());
            }
            file_hasher.update(raw);
            bytes_written += raw.size();

            if (!options.quiet) {
                std::cout << "  chunk " << c.index << " (" << c.original_size << " bytes)" << std::endl;
            }
        }

        out_f.close();
        if (!out_f) {
            throw IOError("Failed to finish writing " + partial_path.string());
        }
    }

    if (bytes_written != mf.source_size) {
        throw RebuildIncomplete("Rebuilt " + std::to_string(bytes_written) + " bytes, manifest declares " +
                                std::to_string(mf.source_size));
    }
    if (file_hasher.hex_digest() != mf.source_hash) {
        throw RebuildIncomplete("Rebuilt file does not match the manifest source_hash");
    }

    std::error_code ec;
    fs::rename(partial_path, out_path, ec);
    if (ec) {
        throw IOError("Failed to move " + partial_path.string() + " to " + out_path.string() + ": " + ec.message());
    }
    partial_guard.release();

    if (!options.quiet) {
        std::cout << "Done. " << bytes_written << " bytes written to " << out_path.string() << std::endl;
    }
    return bytes_written;
}
