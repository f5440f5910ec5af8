#include "chunk_store.hpp"
#include "compressor.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

std::string ChunkStore::chunk_file_name(const std::string& stem, uint32_t index, ChunkForm form, Codec codec) {
    std::ostringstream oss;
    oss << stem << ".part" << std::setw(CHUNK_INDEX_WIDTH) << std::setfill('0') << index
        << "." << chunk_suffix(form, codec);
    return oss.str();
}

bool ChunkStore::meets_min_gain(size_t raw_size, size_t compressed_size, double min_gain) {
    if (raw_size == 0) return false;
    // Floored so a compressed chunk never exceeds raw_size * (1 - min_gain).
    auto limit = static_cast<size_t>(std::floor(static_cast<double>(raw_size) * (1.0 - min_gain)));
    return compressed_size <= limit;
}

ChunkEntry ChunkStore::store_chunk(const Bytes& raw, uint32_t index, int level, double min_gain, Codec codec) const {
    ChunkEntry entry;
    entry.index = index;
    entry.original_size = raw.size();
    entry.hash = sha256_hex(raw);

    Bytes compressed = compress_data(raw, level, codec);
    const Bytes* payload = &raw;
    if (meets_min_gain(raw.size(), compressed.size(), min_gain)) {
        entry.form = ChunkForm::Compressed;
        payload = &compressed;
    } else {
        entry.form = ChunkForm::Raw;
    }

    entry.stored_size = payload->size();
    entry.stored_hash = sha256_hex(*payload);
    entry.file_name = chunk_file_name(stem_, index, entry.form, codec);

    // Removed again if the write fails part way.
    ScopedFileRemover partial(dir_ / entry.file_name);
    write_filepath(dir_ / entry.file_name, *payload);
    partial.release();
    return entry;
}

Bytes ChunkStore::load_stored(const ChunkEntry& entry) const {
    fs::path path = chunk_path(entry);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw MissingChunkFile(path.string());
    }
    return read_filepath(path);
}

Bytes ChunkStore::load_chunk(const ChunkEntry& entry, Codec codec) const {
    return decode_chunk(entry, load_stored(entry), codec);
}

Bytes ChunkStore::decode_chunk(const ChunkEntry& entry, Bytes stored, Codec codec) const {
    if (entry.form == ChunkForm::Raw) {
        if (stored.size() != entry.original_size) {
            throw CorruptData("Chunk " + std::to_string(entry.index) + ": raw file is " +
                              std::to_string(stored.size()) + " bytes, expected " +
                              std::to_string(entry.original_size));
        }
        return stored;
    }

    Bytes raw;
    try {
        raw = decompress_data(stored, codec, static_cast<size_t>(entry.original_size));
    } catch (const CorruptData& e) {
        throw CorruptData("Chunk " + std::to_string(entry.index) + ": " + e.what());
    }
    if (raw.size() != entry.original_size) {
        throw CorruptData("Chunk " + std::to_string(entry.index) + ": decompressed to " +
                          std::to_string(raw.size()) + " bytes, expected " +
                          std::to_string(entry.original_size));
    }
    return raw;
}
