#ifndef CHUNKER_HPP
#define CHUNKER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include "manifest.hpp"

struct ChunkOptions {
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    int level = DEFAULT_LEVEL;
    double min_gain = DEFAULT_MIN_GAIN;
    Codec codec = Codec::Gzip;
    // Defaults to <source dir>/chunks_<stem>
    std::optional<std::filesystem::path> out_dir;
    // Replace an existing store for the same stem instead of failing.
    bool overwrite = false;
    bool quiet = false;

    // Throws InvalidParameters.
    void validate() const;
};

struct ChunkResult {
    std::filesystem::path dir;
    Manifest manifest;
};

std::filesystem::path default_chunk_dir(const std::filesystem::path& source);

// Splits source into chunk files plus manifest.json.
ChunkResult chunk_file(const std::filesystem::path& source, const ChunkOptions& options);

#endif // CHUNKER_HPP
