#include "verifier.hpp"
#include "chunk_store.hpp"
#include "compressor.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include "manifest.hpp"
#include <iostream>

namespace fs = std::filesystem;

std::string failure_reason_to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::MissingChunkFile: return "missing";
        case FailureReason::CorruptData: return "corrupt";
        case FailureReason::HashMismatch: return "hash mismatch";
    }
    return "unknown";
}

std::vector<uint32_t> VerifyReport::failed_indices() const {
    std::vector<uint32_t> out;
    out.reserve(failures.size());
    for (const auto& f : failures) {
        out.push_back(f.index);
    }
    return out;
}

VerifyReport verify_store(const fs::path& chunk_dir, const VerifyOptions& options) {
    Manifest mf = read_manifest(manifest_path(chunk_dir));
    ChunkStore store(chunk_dir, fs::path(mf.source_name).stem().string());

    VerifyReport report;
    report.source_name = mf.source_name;
    report.source_size = mf.source_size;

    if (!options.quiet) {
        std::cout << "Verifying " << mf.chunks.size() << " chunk(s) of " << mf.source_name << "..." << std::endl;
    }

    Sha256 file_hasher;
    for (const auto& c : mf.chunks) {
        ++report.chunks_checked;

        auto fail = [&](FailureReason reason, const std::string& detail) {
            report.failures.push_back({c.index, reason, detail});
            if (!options.quiet) {
                std::cout << "  chunk " << c.index << ": FAIL (" << failure_reason_to_string(reason) << ") "
                          << detail << std::endl;
            }
        };

        Bytes stored;
        try {
            stored = store.load_stored(c);
        } catch (const MissingChunkFile& e) {
            fail(FailureReason::MissingChunkFile, e.what());
            continue;
        } catch (const IOError& e) {
            fail(FailureReason::MissingChunkFile, e.what());
            continue;
        }

        if (stored.size() != c.stored_size || sha256_hex(stored) != c.stored_hash) {
            // Damaged on disk; report undecodable payloads as corrupt.
            FailureReason reason = FailureReason::HashMismatch;
            std::string detail = "stored bytes of " + c.file_name + " do not match stored_hash";
            if (c.form == ChunkForm::Compressed) {
                try {
                    decompress_data(stored, mf.codec, static_cast<size_t>(c.original_size));
                } catch (const CorruptData& e) {
                    reason = FailureReason::CorruptData;
                    detail = e.what();
                }
            }
            fail(reason, detail);
            continue;
        }

        Bytes raw;
        try {
            raw = store.decode_chunk(c, std::move(stored), mf.codec);
        } catch (const CorruptData& e) {
            fail(FailureReason::CorruptData, e.what());
            continue;
        }

        if (sha256_hex(raw) != c.hash) {
            fail(FailureReason::HashMismatch, "content of " + c.file_name + " does not match hash");
            continue;
        }

        if (report.failures.empty()) {
            file_hasher.update(raw);
        }
        if (!options.quiet) {
            std::cout << "  chunk " << c.index << ": OK" << std::endl;
        }
    }

    if (report.failures.empty()) {
        report.source_hash_checked = true;
        report.source_hash_ok = file_hasher.hex_digest() == mf.source_hash;
    }

    if (!options.quiet) {
        if (report.ok()) {
            std::cout << "OK: " << report.chunks_checked << " chunk(s) verified" << std::endl;
        } else if (!report.failures.empty()) {
            std::cout << "FAIL: " << report.failures.size() << " of " << report.chunks_checked
                      << " chunk(s) failed" << std::endl;
        } else {
            std::cout << "FAIL: whole-file hash does not match the manifest" << std::endl;
        }
    }
    return report;
}
