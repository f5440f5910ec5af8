#ifndef MANIFEST_HPP
#define MANIFEST_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "shared_structure.hpp"
#include "utils.hpp"

struct ChunkEntry {
    uint32_t index = 0;
    uint64_t original_size = 0;
    uint64_t stored_size = 0;
    ChunkForm form = ChunkForm::Raw;
    std::string hash;         // SHA-256 of the original bytes
    std::string stored_hash;  // SHA-256 of the bytes on disk
    std::string file_name;
};

struct Manifest {
    uint32_t version = MANIFEST_VERSION;
    std::string source_name;
    uint64_t source_size = 0;
    std::string source_hash;
    uint64_t stored_size_total = 0;
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    int compression_level = DEFAULT_LEVEL;
    double min_gain = DEFAULT_MIN_GAIN;
    Codec codec = Codec::Gzip;
    int64_t created_at_unix = 0;
    std::vector<ChunkEntry> chunks;

    json to_json() const;
    // Throws ManifestMalformed on any schema or consistency violation.
    static Manifest from_json(const json& j);
};

std::filesystem::path manifest_path(const std::filesystem::path& chunk_dir);

// Serializes to path (via a temporary file renamed into place). Throws IOError.
void write_manifest(const Manifest& manifest, const std::filesystem::path& path);

// Parses and validates path. Throws ManifestMalformed.
Manifest read_manifest(const std::filesystem::path& path);

#endif // MANIFEST_HPP
