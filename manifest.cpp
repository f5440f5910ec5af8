#include "manifest.hpp"
#include "chunk_store.hpp"
#include "errors.hpp"
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

namespace {

const json& require_field(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw ManifestMalformed("Missing field '" + std::string(key) + "' in " + where);
    }
    return *it;
}

uint64_t get_unsigned(const json& obj, const char* key, const std::string& where) {
    const json& v = require_field(obj, key, where);
    if (!v.is_number_unsigned()) {
        throw ManifestMalformed("Field '" + std::string(key) + "' in " + where + " must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

int64_t get_integer(const json& obj, const char* key, const std::string& where) {
    const json& v = require_field(obj, key, where);
    if (!v.is_number_integer()) {
        throw ManifestMalformed("Field '" + std::string(key) + "' in " + where + " must be an integer");
    }
    return v.get<int64_t>();
}

double get_number(const json& obj, const char* key, const std::string& where) {
    const json& v = require_field(obj, key, where);
    if (!v.is_number()) {
        throw ManifestMalformed("Field '" + std::string(key) + "' in " + where + " must be a number");
    }
    return v.get<double>();
}

std::string get_string(const json& obj, const char* key, const std::string& where) {
    const json& v = require_field(obj, key, where);
    if (!v.is_string()) {
        throw ManifestMalformed("Field '" + std::string(key) + "' in " + where + " must be a string");
    }
    return v.get<std::string>();
}

std::string get_hash(const json& obj, const char* key, const std::string& where) {
    std::string h = get_string(obj, key, where);
    if (!is_hex_string(h, SHA256_HEX_LEN)) {
        throw ManifestMalformed("Field '" + std::string(key) + "' in " + where + " is not a SHA-256 hex digest");
    }
    return h;
}

// Chunk names come from the manifest and must stay inside the chunk directory.
bool is_safe_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) return false;
    if (name.find('\0') != std::string::npos) return false;
    return true;
}

ChunkEntry parse_chunk(const json& c, size_t position, const Manifest& mf, const std::string& stem) {
    std::string where = "chunks[" + std::to_string(position) + "]";
    if (!c.is_object()) {
        throw ManifestMalformed(where + " must be an object");
    }

    ChunkEntry entry;
    uint64_t index = get_unsigned(c, "index", where);
    if (index != position) {
        throw ManifestMalformed(where + " has index " + std::to_string(index) +
                                ", expected " + std::to_string(position));
    }
    entry.index = static_cast<uint32_t>(index);
    entry.original_size = get_unsigned(c, "original_size", where);
    entry.stored_size = get_unsigned(c, "stored_size", where);
    entry.form = form_from_string(get_string(c, "form", where));
    entry.hash = get_hash(c, "hash", where);
    entry.stored_hash = get_hash(c, "stored_hash", where);
    entry.file_name = get_string(c, "file_name", where);

    if (entry.original_size == 0 || entry.original_size > mf.chunk_size) {
        throw ManifestMalformed(where + " original_size " + std::to_string(entry.original_size) +
                                " is outside (0, " + std::to_string(mf.chunk_size) + "]");
    }
    if (entry.form == ChunkForm::Raw && entry.stored_size != entry.original_size) {
        throw ManifestMalformed(where + " is raw but stored_size differs from original_size");
    }
    if (!is_safe_file_name(entry.file_name)) {
        throw ManifestMalformed(where + " has an invalid file_name '" + entry.file_name + "'");
    }
    std::string expected_name = ChunkStore::chunk_file_name(stem, entry.index, entry.form, mf.codec);
    if (entry.file_name != expected_name) {
        throw ManifestMalformed(where + " file_name '" + entry.file_name + "' should be '" + expected_name + "'");
    }
    if (entry.form == ChunkForm::Compressed &&
        !ChunkStore::meets_min_gain(entry.original_size, entry.stored_size, mf.min_gain)) {
        throw ManifestMalformed(where + " is compressed but stored_size " + std::to_string(entry.stored_size) +
                                " does not meet min_gain for original_size " + std::to_string(entry.original_size));
    }
    return entry;
}

} // namespace

json Manifest::to_json() const {
    json j;
    j["version"] = version;
    j["source_name"] = source_name;
    j["source_size"] = source_size;
    j["source_hash"] = source_hash;
    j["chunk_size"] = chunk_size;
    j["compression_level"] = compression_level;
    j["min_gain"] = min_gain;
    j["codec"] = codec_to_string(codec);
    j["created_at_unix"] = created_at_unix;
    j["stored_size_total"] = stored_size_total;

    json chunks_json = json::array();
    for (const auto& c : chunks) {
        chunks_json.push_back({
            {"index", c.index},
            {"original_size", c.original_size},
            {"stored_size", c.stored_size},
            {"form", form_to_string(c.form)},
            {"hash", c.hash},
            {"stored_hash", c.stored_hash},
            {"file_name", c.file_name}
        });
    }
    j["chunks"] = chunks_json;
    return j;
}

Manifest Manifest::from_json(const json& j) {
    const std::string where = "manifest";
    if (!j.is_object()) {
        throw ManifestMalformed("Manifest root must be a JSON object");
    }

    Manifest mf;
    uint64_t version = get_unsigned(j, "version", where);
    if (version != MANIFEST_VERSION) {
        throw ManifestMalformed("Unsupported manifest version " + std::to_string(version));
    }
    mf.version = static_cast<uint32_t>(version);
    mf.source_name = get_string(j, "source_name", where);
    mf.source_size = get_unsigned(j, "source_size", where);
    mf.source_hash = get_hash(j, "source_hash", where);
    mf.chunk_size = get_unsigned(j, "chunk_size", where);
    if (mf.chunk_size == 0) {
        throw ManifestMalformed("chunk_size must be positive");
    }
    if (mf.chunk_size > std::numeric_limits<uint32_t>::max()) {
        throw ManifestMalformed("chunk_size " + std::to_string(mf.chunk_size) + " exceeds " +
                                std::to_string(std::numeric_limits<uint32_t>::max()) + " bytes");
    }

    int64_t level = get_integer(j, "compression_level", where);
    if (level < MIN_LEVEL || level > MAX_LEVEL) {
        throw ManifestMalformed("compression_level " + std::to_string(level) + " is outside 1-9");
    }
    mf.compression_level = static_cast<int>(level);

    mf.min_gain = get_number(j, "min_gain", where);
    if (!(mf.min_gain >= 0.0 && mf.min_gain < 1.0)) {
        throw ManifestMalformed("min_gain must be in [0, 1)");
    }

    try {
        mf.codec = codec_from_string(get_string(j, "codec", where));
    } catch (const InvalidParameters& e) {
        throw ManifestMalformed(e.what());
    }
    mf.created_at_unix = get_integer(j, "created_at_unix", where);
    mf.stored_size_total = get_unsigned(j, "stored_size_total", where);

    const json& chunks_json = require_field(j, "chunks", where);
    if (!chunks_json.is_array()) {
        throw ManifestMalformed("Field 'chunks' must be an array");
    }
    if (chunks_json.size() > std::numeric_limits<uint32_t>::max()) {
        throw ManifestMalformed("Too many chunks");
    }

    const std::string stem = fs::path(mf.source_name).stem().string();
    uint64_t original_total = 0;
    uint64_t stored_total = 0;
    mf.chunks.reserve(chunks_json.size());
    for (size_t i = 0; i < chunks_json.size(); ++i) {
        ChunkEntry entry = parse_chunk(chunks_json[i], i, mf, stem);
        original_total += entry.original_size;
        stored_total += entry.stored_size;
        mf.chunks.push_back(std::move(entry));
    }

    if (original_total != mf.source_size) {
        throw ManifestMalformed("Sum of chunk sizes (" + std::to_string(original_total) +
                                ") does not match source_size (" + std::to_string(mf.source_size) + ")");
    }
    if (stored_total != mf.stored_size_total) {
        throw ManifestMalformed("Sum of stored sizes (" + std::to_string(stored_total) +
                                ") does not match stored_size_total (" + std::to_string(mf.stored_size_total) + ")");
    }
    return mf;
}

fs::path manifest_path(const fs::path& chunk_dir) {
    return chunk_dir / MANIFEST_NAME;
}

void write_manifest(const Manifest& manifest, const fs::path& path) {
    fs::path tmp_path = path;
    tmp_path += ".tmp";
    ScopedFileRemover tmp_guard(tmp_path);

    std::string text = manifest.to_json().dump(4) + "\n";
    write_filepath(tmp_path, reinterpret_cast<const uint8_t*>(text.data()), text.size());

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        throw IOError("Failed to write manifest " + path.string() + ": " + ec.message());
    }
    tmp_guard.release();
}

Manifest read_manifest(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ManifestMalformed("manifest.json not found: " + path.string());
    }

    std::ifstream meta_file(path);
    if (!meta_file) {
        throw ManifestMalformed("Cannot open manifest: " + path.string());
    }

    json j;
    try {
        j = json::parse(meta_file);
    } catch (const json::exception& e) {
        throw ManifestMalformed("Manifest " + path.string() + " is not valid JSON: " + e.what());
    }

    try {
        return Manifest::from_json(j);
    } catch (const ManifestMalformed& e) {
        throw ManifestMalformed(path.string() + ": " + e.what());
    }
}
