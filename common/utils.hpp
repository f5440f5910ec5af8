#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <utility>
#include <nlohmann/json.hpp>

// Use nlohmann::ordered_json so manifest.json keeps a stable field order
using json = nlohmann::ordered_json;

using Bytes = std::vector<uint8_t>;

// Converts a vector of bytes to a lowercase hex string.
std::string bytes_to_hex(const Bytes& bytes);
std::string bytes_to_hex(const uint8_t* bytes, size_t size);

// True if s is exactly `length` lowercase or uppercase hex digits.
bool is_hex_string(const std::string& s, size_t length);

// Reads the entire content of a file. Throws IOError on failure.
Bytes read_filepath(const std::filesystem::path& path);

// Writes data to path, truncating it. Throws IOError on failure.
void write_filepath(const std::filesystem::path& path, const uint8_t* data, size_t size);
void write_filepath(const std::filesystem::path& path, const Bytes& data);

// Formats a byte count like "1.50 MiB".
std::string format_size(uint64_t bytes);

// Removes a file when the guard goes out of scope unless release() was called.
class ScopedFileRemover {
public:
    explicit ScopedFileRemover(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedFileRemover();
    ScopedFileRemover(const ScopedFileRemover&) = delete;
    ScopedFileRemover& operator=(const ScopedFileRemover&) = delete;

    void release() { active_ = false; }

private:
    std::filesystem::path path_;
    bool active_ = true;
};

#endif // UTILS_HPP
