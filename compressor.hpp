#ifndef COMPRESSOR_HPP
#define COMPRESSOR_HPP

#include <cstddef>
#include <optional>
#include "utils.hpp"
#include "shared_structure.hpp"

// Compresses input at the given level (1-9). gzip output is a complete
// gzip member (header + deflate + trailer), zstd output is a single frame.
Bytes compress_data(const Bytes& input, int level, Codec codec);

// Inverse of compress_data. Throws CorruptData if the input is not a valid,
// complete stream or decodes to more than expected_size bytes.
Bytes decompress_data(const Bytes& input, Codec codec, std::optional<size_t> expected_size = std::nullopt);

#endif // COMPRESSOR_HPP
