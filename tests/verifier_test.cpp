#include <gtest/gtest.h>
#include "chunker.hpp"
#include "errors.hpp"
#include "verifier.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

class VerifierTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        Bytes data = repeated_bytes(6000, 'B');
        Bytes noise = random_bytes(6000, 23);
        data.insert(data.end(), noise.begin(), noise.end());
        Bytes text = text_bytes(6000);
        data.insert(data.end(), text.begin(), text.end());

        ChunkOptions o;
        o.chunk_size = 2000;
        o.quiet = true;
        store = chunk_file(make_file("payload.bin", data), o);
    }

    VerifyReport run() const { return verify_store(store.dir, VerifyOptions{true}); }

    ChunkResult store;
};

TEST_F(VerifierTest, UntouchedStorePasses) {
    VerifyReport r = run();
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.chunks_checked, 9u);
    EXPECT_TRUE(r.failures.empty());
    EXPECT_TRUE(r.source_hash_checked);
    EXPECT_TRUE(r.source_hash_ok);
    EXPECT_EQ(r.source_size, 18000u);
}

TEST_F(VerifierTest, FlippedByteReportsExactlyThatChunk) {
    for (const auto& c : store.manifest.chunks) {
        fs::path p = store.dir / c.file_name;
        Bytes original = read_filepath(p);
        flip_byte(p, original.size() / 2);

        VerifyReport r = run();
        EXPECT_FALSE(r.ok()) << c.index;
        EXPECT_EQ(r.chunks_checked, store.manifest.chunks.size());
        EXPECT_EQ(r.failed_indices(), std::vector<uint32_t>{c.index}) << c.index;
        EXPECT_FALSE(r.source_hash_checked);

        write_filepath(p, original);
    }
    EXPECT_TRUE(run().ok());
}

TEST_F(VerifierTest, MissingFileIsCollected) {
    const ChunkEntry& c = store.manifest.chunks[4];
    fs::remove(store.dir / c.file_name);

    VerifyReport r = run();
    ASSERT_EQ(r.failures.size(), 1u);
    EXPECT_EQ(r.failures[0].index, 4u);
    EXPECT_EQ(r.failures[0].reason, FailureReason::MissingChunkFile);
    EXPECT_EQ(r.chunks_checked, 9u);
}

TEST_F(VerifierTest, UndecodableChunkIsCorrupt) {
    const ChunkEntry& c = store.manifest.chunks[0];
    ASSERT_EQ(c.form, ChunkForm::Compressed);
    flip_byte(store.dir / c.file_name, 0);

    VerifyReport r = run();
    ASSERT_EQ(r.failures.size(), 1u);
    EXPECT_EQ(r.failures[0].index, 0u);
    EXPECT_EQ(r.failures[0].reason, FailureReason::CorruptData);
}

TEST_F(VerifierTest, TamperedRawChunkIsHashMismatch) {
    const ChunkEntry& c = store.manifest.chunks[4];
    ASSERT_EQ(c.form, ChunkForm::Raw);
    flip_byte(store.dir / c.file_name, 10);

    VerifyReport r = run();
    ASSERT_EQ(r.failures.size(), 1u);
    EXPECT_EQ(r.failures[0].reason, FailureReason::HashMismatch);
}

TEST_F(VerifierTest, SeveralFailuresAreAllReported) {
    fs::remove(store.dir / store.manifest.chunks[1].file_name);
    flip_byte(store.dir / store.manifest.chunks[5].file_name, 3);
    flip_byte(store.dir / store.manifest.chunks[8].file_name, 0);

    VerifyReport r = run();
    EXPECT_EQ(r.failed_indices(), (std::vector<uint32_t>{1, 5, 8}));
}

TEST_F(VerifierTest, DoesNotModifyStore) {
    Bytes manifest_before = read_filepath(store.dir / "manifest.json");
    fs::remove(store.dir / store.manifest.chunks[2].file_name);
    run();
    EXPECT_EQ(read_filepath(store.dir / "manifest.json"), manifest_before);
    EXPECT_FALSE(fs::exists(store.dir / store.manifest.chunks[2].file_name));
}

TEST_F(VerifierTest, MalformedManifestIsFatal) {
    write_filepath(store.dir / "manifest.json", Bytes{'{', '}'});
    EXPECT_THROW(run(), ManifestMalformed);
}

TEST_F(VerifierTest, OversizeChunkSizeIsRejectedBeforeDecoding) {
    Manifest mf = store.manifest;
    ASSERT_EQ(mf.chunks[0].form, ChunkForm::Compressed);
    const uint64_t huge = 1ull << 60;
    mf.chunks.resize(1);
    mf.chunks[0].original_size = huge;
    mf.chunk_size = huge;
    mf.source_size = huge;
    mf.stored_size_total = mf.chunks[0].stored_size;
    write_manifest(mf, manifest_path(store.dir));

    EXPECT_THROW(run(), ManifestMalformed);
}

TEST(FailureReasonTest, Names) {
    EXPECT_EQ(failure_reason_to_string(FailureReason::MissingChunkFile), "missing");
    EXPECT_EQ(failure_reason_to_string(FailureReason::CorruptData), "corrupt");
    EXPECT_EQ(failure_reason_to_string(FailureReason::HashMismatch), "hash mismatch");
}
