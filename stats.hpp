#ifndef STATS_HPP
#define STATS_HPP

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include "shared_structure.hpp"

struct StatsReport {
    std::string source_name;
    uint64_t source_size = 0;
    uint64_t chunk_size = 0;
    Codec codec = Codec::Gzip;
    int compression_level = 0;
    double min_gain = 0.0;

    size_t total_chunks = 0;
    size_t raw_chunks = 0;
    uint64_t raw_bytes = 0;
    size_t compressed_chunks = 0;
    uint64_t compressed_original_bytes = 0;
    uint64_t compressed_stored_bytes = 0;
    uint64_t stored_total = 0;

    // stored_total / source_size, 1.0 for an empty source
    double compression_ratio = 1.0;
    double average_chunk_size = 0.0;

    // Taken from the chunk files themselves, not the manifest.
    uint64_t on_disk_total = 0;
    size_t missing_files = 0;

    void print(std::ostream& os) const;
};

StatsReport collect_stats(const std::filesystem::path& chunk_dir);

#endif // STATS_HPP
