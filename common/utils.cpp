#include "utils.hpp"
#include "errors.hpp"
#include "shared_structure.hpp"
#include <cctype>

std::string form_to_string(ChunkForm form) {
    return form == ChunkForm::Compressed ? "compressed" : "raw";
}

ChunkForm form_from_string(const std::string& s) {
    if (s == "raw") return ChunkForm::Raw;
    if (s == "compressed") return ChunkForm::Compressed;
    throw ManifestMalformed("Unknown chunk form '" + s + "'");
}

std::string codec_to_string(Codec codec) {
    return codec == Codec::Zstd ? "zstd" : "gzip";
}

Codec codec_from_string(const std::string& s) {
    if (s == "gzip") return Codec::Gzip;
    if (s == "zstd") return Codec::Zstd;
    throw InvalidParameters("Unknown codec '" + s + "'. Use 'gzip' or 'zstd'.");
}

std::string chunk_suffix(ChunkForm form, Codec codec) {
    if (form == ChunkForm::Raw) return "raw";
    return codec == Codec::Zstd ? "zst" : "gz";
}

std::string bytes_to_hex(const Bytes& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

std::string bytes_to_hex(const uint8_t* bytes, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

bool is_hex_string(const std::string& s, size_t length) {
    if (s.size() != length) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Bytes read_filepath(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Failed to open file: " + path.string());
    }
    std::streamsize size = file.tellg();
    if (size < 0) {
        throw IOError("Failed to determine size of file: " + path.string());
    }
    file.seekg(0, std::ios::beg);
    Bytes buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Failed to read file: " + path.string());
    }
    return buffer;
}

void write_filepath(const std::filesystem::path& path, const uint8_t* data, size_t size) {
    std::ofstream out_f(path, std::ios::binary | std::ios::trunc);
    if (!out_f) {
        throw IOError("Failed to open output file: " + path.string());
    }
    out_f.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    out_f.close();
    if (!out_f) {
        throw IOError("Failed to write file: " + path.string());
    }
}

void write_filepath(const std::filesystem::path& path, const Bytes& data) {
    write_filepath(path, data.data(), data.size());
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    }
    return oss.str();
}

ScopedFileRemover::~ScopedFileRemover() {
    if (active_) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
}
