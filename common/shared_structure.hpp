#ifndef SHARED_STRUCTURE_HPP
#define SHARED_STRUCTURE_HPP

#include <cstdint>
#include <cstddef>
#include <string>

enum class ChunkForm {
    Raw,
    Compressed
};

enum class Codec {
    Gzip,
    Zstd
};

// Manifest spellings of the enums above.
std::string form_to_string(ChunkForm form);
ChunkForm form_from_string(const std::string& s);
std::string codec_to_string(Codec codec);
Codec codec_from_string(const std::string& s);

// File suffix used for a chunk stored in the given form ("raw", "gz", "zst").
std::string chunk_suffix(ChunkForm form, Codec codec);

constexpr uint32_t MANIFEST_VERSION = 1;
constexpr const char* MANIFEST_NAME = "manifest.json";
constexpr const char* CHUNK_DIR_PREFIX = "chunks_";
constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
constexpr int DEFAULT_LEVEL = 6;
constexpr double DEFAULT_MIN_GAIN = 0.02;
constexpr int MIN_LEVEL = 1;
constexpr int MAX_LEVEL = 9;
constexpr int CHUNK_INDEX_WIDTH = 6;
constexpr size_t SHA256_HEX_LEN = 64;
constexpr size_t IO_BUFFER_SIZE = 1024 * 1024;
#endif
