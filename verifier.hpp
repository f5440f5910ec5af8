#ifndef VERIFIER_HPP
#define VERIFIER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

enum class FailureReason {
    MissingChunkFile,
    CorruptData,
    HashMismatch
};

std::string failure_reason_to_string(FailureReason reason);

struct ChunkFailure {
    uint32_t index;
    FailureReason reason;
    std::string detail;
};

struct VerifyReport {
    std::string source_name;
    uint64_t source_size = 0;
    size_t chunks_checked = 0;
    std::vector<ChunkFailure> failures;
    // Whole-file digest only recomputed when every chunk passed.
    bool source_hash_checked = false;
    bool source_hash_ok = false;

    bool ok() const { return failures.empty() && source_hash_checked && source_hash_ok; }
    std::vector<uint32_t> failed_indices() const;
};

struct VerifyOptions {
    bool quiet = false;
};

// Checks every chunk against the manifest without writing anything.
// Chunk-level problems are collected in the report; only an unreadable or
// malformed manifest throws (ManifestMalformed).
VerifyReport verify_store(const std::filesystem::path& chunk_dir, const VerifyOptions& options = {});

#endif // VERIFIER_HPP
