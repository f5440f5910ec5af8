#include <gtest/gtest.h>
#include <cmath>
#include "chunk_store.hpp"
#include "chunker.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include "rebuilder.hpp"
#include "stats.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

class ChunkerTest : public TempDirTest {
protected:
    ChunkOptions options(uint64_t chunk_size, double min_gain = 0.02) const {
        ChunkOptions o;
        o.chunk_size = chunk_size;
        o.min_gain = min_gain;
        o.quiet = true;
        return o;
    }

    // Checks the structural invariants every successful run must satisfy.
    static void expect_valid(const Manifest& mf, const fs::path& dir) {
        uint64_t total = 0;
        for (size_t i = 0; i < mf.chunks.size(); ++i) {
            const ChunkEntry& c = mf.chunks[i];
            EXPECT_EQ(c.index, i);
            EXPECT_GT(c.original_size, 0u);
            EXPECT_LE(c.original_size, mf.chunk_size);
            if (c.form == ChunkForm::Raw) {
                EXPECT_EQ(c.stored_size, c.original_size);
            } else {
                EXPECT_LE(static_cast<double>(c.stored_size),
                          std::floor(static_cast<double>(c.original_size) * (1.0 - mf.min_gain)));
            }
            EXPECT_EQ(fs::file_size(dir / c.file_name), c.stored_size);
            total += c.original_size;
        }
        EXPECT_EQ(total, mf.source_size);
    }
};

TEST_F(ChunkerTest, RoundTripAcrossChunkSizes) {
    Bytes data = text_bytes(6000);
    Bytes noise = random_bytes(3000, 11);
    data.insert(data.end(), noise.begin(), noise.end());
    fs::path src = make_file("mixed.bin", data);

    for (uint64_t size : {1ull, 7ull, 1000ull, 4096ull, 4500ull, 9000ull, 20000ull}) {
        ChunkOptions o = options(size);
        o.out_dir = path("store_" + std::to_string(size));
        ChunkResult result = chunk_file(src, o);

        EXPECT_EQ(result.manifest.chunks.size(), (data.size() + size - 1) / size) << size;
        expect_valid(result.manifest, result.dir);

        fs::path out = path("rebuilt_" + std::to_string(size) + ".bin");
        EXPECT_EQ(rebuild_file(result.dir, out, RebuildOptions{true}), data.size());
        EXPECT_EQ(read_filepath(out), data) << size;
    }
}

TEST_F(ChunkerTest, ManifestOnDiskMatchesResult) {
    fs::path src = make_file("doc.txt", text_bytes(10000));
    ChunkResult result = chunk_file(src, options(3000));

    Manifest on_disk = read_manifest(manifest_path(result.dir));
    EXPECT_EQ(on_disk.source_name, "doc.txt");
    EXPECT_EQ(on_disk.source_size, 10000u);
    EXPECT_EQ(on_disk.source_hash, sha256_hex(read_filepath(src)));
    ASSERT_EQ(on_disk.chunks.size(), result.manifest.chunks.size());
    for (size_t i = 0; i < on_disk.chunks.size(); ++i) {
        EXPECT_EQ(on_disk.chunks[i].file_name, result.manifest.chunks[i].file_name);
        EXPECT_EQ(on_disk.chunks[i].hash, result.manifest.chunks[i].hash);
    }
    EXPECT_EQ(on_disk.chunks.back().original_size, 1000u);
}

TEST_F(ChunkerTest, DefaultDirectoryAndNames) {
    fs::path src = make_file("photo.raw.bin", text_bytes(5000));
    ChunkResult result = chunk_file(src, options(2048));

    EXPECT_EQ(result.dir.string(), (root / "chunks_photo.raw").string());
    EXPECT_TRUE(fs::exists(result.dir / "manifest.json"));
    for (const auto& c : result.manifest.chunks) {
        EXPECT_EQ(c.file_name, ChunkStore::chunk_file_name("photo.raw", c.index, c.form, Codec::Gzip));
    }
}

TEST_F(ChunkerTest, RepeatedByteScenario) {
    fs::path src = make_file("ten.bin", repeated_bytes(10, 'x'));
    ChunkOptions o = options(4, 0.02);
    o.level = 6;
    ChunkResult result = chunk_file(src, o);

    ASSERT_EQ(result.manifest.chunks.size(), 3u);
    EXPECT_EQ(result.manifest.chunks[0].original_size, 4u);
    EXPECT_EQ(result.manifest.chunks[1].original_size, 4u);
    EXPECT_EQ(result.manifest.chunks[2].original_size, 2u);
    expect_valid(result.manifest, result.dir);

    StatsReport stats = collect_stats(result.dir);
    EXPECT_EQ(stats.total_chunks, 3u);
    EXPECT_EQ(stats.source_size, 10u);
}

TEST_F(ChunkerTest, RepeatedByteWindowsLargeEnoughCompress) {
    fs::path src = make_file("zeros.bin", repeated_bytes(40000, 0));
    ChunkResult result = chunk_file(src, options(4096));
    for (const auto& c : result.manifest.chunks) {
        EXPECT_EQ(c.form, ChunkForm::Compressed) << c.index;
    }
    expect_valid(result.manifest, result.dir);
}

TEST_F(ChunkerTest, RandomDataStaysRaw) {
    fs::path src = make_file("random.bin", random_bytes(1000, 2024));
    for (uint64_t size : {100ull, 333ull, 1000ull, 5000ull}) {
        ChunkOptions o = options(size);
        o.out_dir = path("r" + std::to_string(size));
        ChunkResult result = chunk_file(src, o);
        for (const auto& c : result.manifest.chunks) {
            EXPECT_EQ(c.form, ChunkForm::Raw);
        }
        EXPECT_DOUBLE_EQ(collect_stats(result.dir).compression_ratio, 1.0);
    }
}

TEST_F(ChunkerTest, ZstdCodec) {
    Bytes data = text_bytes(20000);
    fs::path src = make_file("log.txt", data);
    ChunkOptions o = options(5000);
    o.codec = Codec::Zstd;
    ChunkResult result = chunk_file(src, o);

    EXPECT_EQ(read_manifest(manifest_path(result.dir)).codec, Codec::Zstd);
    bool any_zst = false;
    for (const auto& c : result.manifest.chunks) {
        if (c.form == ChunkForm::Compressed) {
            any_zst = true;
            EXPECT_EQ(fs::path(c.file_name).extension().string(), ".zst");
        }
    }
    EXPECT_TRUE(any_zst);

    fs::path out = path("log.out");
    rebuild_file(result.dir, out, RebuildOptions{true});
    EXPECT_EQ(read_filepath(out), data);
}

TEST_F(ChunkerTest, EmptySource) {
    fs::path src = make_file("empty.bin", Bytes{});
    ChunkResult result = chunk_file(src, options(1024));
    EXPECT_TRUE(result.manifest.chunks.empty());
    EXPECT_EQ(result.manifest.source_size, 0u);
    EXPECT_EQ(result.manifest.source_hash, sha256_hex(Bytes{}));

    fs::path out = path("empty.out");
    EXPECT_EQ(rebuild_file(result.dir, out, RebuildOptions{true}), 0u);
    EXPECT_TRUE(fs::exists(out));
    EXPECT_EQ(fs::file_size(out), 0u);
}

TEST_F(ChunkerTest, SourceNotFound) {
    EXPECT_THROW(chunk_file(path("nope.bin"), options(10)), SourceNotFound);
    EXPECT_THROW(chunk_file(root, options(10)), SourceNotFound);
}

TEST_F(ChunkerTest, InvalidParameters) {
    fs::path src = make_file("a.bin", text_bytes(100));

    EXPECT_THROW(chunk_file(src, options(0)), InvalidParameters);
    EXPECT_THROW(chunk_file(src, options(10, 1.0)), InvalidParameters);
    EXPECT_THROW(chunk_file(src, options(10, -0.1)), InvalidParameters);

    ChunkOptions o = options(10);
    o.level = 0;
    EXPECT_THROW(chunk_file(src, o), InvalidParameters);
    o.level = 10;
    EXPECT_THROW(chunk_file(src, o), InvalidParameters);

    EXPECT_FALSE(fs::exists(root / "chunks_a"));
}

TEST_F(ChunkerTest, ExistingStoreRequiresForce) {
    fs::path src = make_file("twice.bin", text_bytes(9000));
    ChunkResult first = chunk_file(src, options(1000));
    make_file("chunks_twice/notes.txt", Bytes{'h', 'i'});

    EXPECT_THROW(chunk_file(src, options(4000)), OutputExists);
    // Failed attempt leaves the first store intact.
    EXPECT_EQ(read_manifest(manifest_path(first.dir)).chunks.size(), 9u);

    ChunkOptions o = options(4000);
    o.overwrite = true;
    ChunkResult second = chunk_file(src, o);
    EXPECT_EQ(second.manifest.chunks.size(), 3u);
    EXPECT_FALSE(fs::exists(second.dir / ChunkStore::chunk_file_name("twice", 8, first.manifest.chunks[8].form, Codec::Gzip)));
    EXPECT_TRUE(fs::exists(second.dir / "notes.txt"));

    size_t chunk_files = 0;
    for (const auto& item : fs::directory_iterator(second.dir)) {
        if (item.path().filename().string().rfind("twice.part", 0) == 0) ++chunk_files;
    }
    EXPECT_EQ(chunk_files, 3u);
}

TEST_F(ChunkerTest, DifferentStemsShareDirectory) {
    fs::path a = make_file("a.bin", text_bytes(3000));
    fs::path b = make_file("b.bin", text_bytes(3000));
    ChunkOptions o = options(1000);
    o.out_dir = path("shared");
    chunk_file(a, o);
    // Same directory already has a manifest, so a second store is refused.
    EXPECT_THROW(chunk_file(b, o), OutputExists);
}

TEST_F(ChunkerTest, FailedWriteRemovesPartialChunk) {
    fs::path src = make_file("big.bin", random_bytes(20000, 21));
    fs::path dir = path("chunks_big");
    {
        FileSizeLimit limit(8000);
        EXPECT_THROW(chunk_file(src, options(10000)), IOError);
    }
    ASSERT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(fs::is_empty(dir));

    // Nothing left over, so a plain retry succeeds without --force.
    ChunkResult result = chunk_file(src, options(10000));
    EXPECT_EQ(result.manifest.chunks.size(), 2u);
    EXPECT_EQ(rebuild_file(result.dir, path("out.bin"), RebuildOptions{true}), 20000u);
}
