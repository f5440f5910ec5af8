#ifndef CHUNK_STORE_HPP
#define CHUNK_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <utility>
#include <string>
#include "manifest.hpp"
#include "utils.hpp"

// Reads and writes the chunk files of one chunk directory.
class ChunkStore {
public:
    ChunkStore(std::filesystem::path dir, std::string stem)
        : dir_(std::move(dir)), stem_(std::move(stem)) {}

    // Hashes and tries to compress one window, then writes exactly one chunk
    // file holding whichever representation satisfies the min-gain rule. A
    // failed write removes the file and throws IOError.
    ChunkEntry store_chunk(const Bytes& raw, uint32_t index, int level, double min_gain, Codec codec) const;

    // Bytes of the chunk file exactly as stored on disk.
    Bytes load_stored(const ChunkEntry& entry) const;

    // Original chunk bytes, decompressed when needed. Throws MissingChunkFile
    // or CorruptData.
    Bytes load_chunk(const ChunkEntry& entry, Codec codec) const;

    // Turns already-loaded stored bytes back into the original chunk bytes.
    Bytes decode_chunk(const ChunkEntry& entry, Bytes stored, Codec codec) const;

    std::filesystem::path chunk_path(const ChunkEntry& entry) const { return dir_ / entry.file_name; }
    const std::filesystem::path& dir() const { return dir_; }

    // "<stem>.part000042.gz"
    static std::string chunk_file_name(const std::string& stem, uint32_t index, ChunkForm form, Codec codec);

    // True when `compressed_size` is small enough to prefer over raw storage.
    static bool meets_min_gain(size_t raw_size, size_t compressed_size, double min_gain);

private:
    std::filesystem::path dir_;
    std::string stem_;
};

#endif // CHUNK_STORE_HPP
