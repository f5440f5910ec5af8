#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base of every error raised by the chunk pipeline.
class ChunkToolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SourceNotFound : public ChunkToolError {
public:
    explicit SourceNotFound(const std::string& path)
        : ChunkToolError("Source file not found: " + path) {}
};

// Bad chunk size, compression level, min-gain or codec.
class InvalidParameters : public ChunkToolError {
public:
    using ChunkToolError::ChunkToolError;
};

class IOError : public ChunkToolError {
public:
    using ChunkToolError::ChunkToolError;
};

class ManifestMalformed : public ChunkToolError {
public:
    using ChunkToolError::ChunkToolError;
};

class MissingChunkFile : public ChunkToolError {
public:
    explicit MissingChunkFile(const std::string& path)
        : ChunkToolError("Chunk file not found: " + path) {}
};

class CorruptData : public ChunkToolError {
public:
    using ChunkToolError::ChunkToolError;
};

class RebuildIncomplete : public ChunkToolError {
public:
    using ChunkToolError::ChunkToolError;
};

// The chunk directory already holds a store for the same stem.
class OutputExists : public ChunkToolError {
public:
    using ChunkToolError::ChunkToolError;
};

#endif // ERRORS_HPP
