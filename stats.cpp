#include "stats.hpp"
#include "manifest.hpp"
#include <iomanip>
#include <ostream>

namespace fs = std::filesystem;

StatsReport collect_stats(const fs::path& chunk_dir) {
    Manifest mf = read_manifest(manifest_path(chunk_dir));

    StatsReport r;
    r.source_name = mf.source_name;
    r.source_size = mf.source_size;
    r.chunk_size = mf.chunk_size;
    r.codec = mf.codec;
    r.compression_level = mf.compression_level;
    r.min_gain = mf.min_gain;
    r.total_chunks = mf.chunks.size();

    for (const auto& c : mf.chunks) {
        if (c.form == ChunkForm::Raw) {
            ++r.raw_chunks;
            r.raw_bytes += c.stored_size;
        } else {
            ++r.compressed_chunks;
            r.compressed_original_bytes += c.original_size;
            r.compressed_stored_bytes += c.stored_size;
        }
        r.stored_total += c.stored_size;

        std::error_code ec;
        auto size = fs::file_size(chunk_dir / c.file_name, ec);
        if (ec) {
            ++r.missing_files;
        } else {
            r.on_disk_total += size;
        }
    }

    if (r.source_size > 0) {
        r.compression_ratio = static_cast<double>(r.stored_total) / static_cast<double>(r.source_size);
    }
    if (r.total_chunks > 0) {
        r.average_chunk_size = static_cast<double>(r.source_size) / static_cast<double>(r.total_chunks);
    }
    return r;
}

void StatsReport::print(std::ostream& os) const {
    os << "Source:            " << source_name << " (" << source_size << " bytes)" << std::endl;
    os << "Chunk size:        " << chunk_size << " bytes" << std::endl;
    os << "Codec:             " << codec_to_string(codec) << " (level " << compression_level
       << ", min gain " << min_gain << ")" << std::endl;
    os << "Total chunks:      " << total_chunks << std::endl;
    os << "  raw:             " << raw_chunks << " (" << raw_bytes << " bytes)" << std::endl;
    os << "  compressed:      " << compressed_chunks << " (" << compressed_original_bytes << " -> "
       << compressed_stored_bytes << " bytes)" << std::endl;
    os << "Stored total:      " << stored_total << " bytes" << std::endl;
    os << "On disk:           " << on_disk_total << " bytes";
    if (missing_files > 0) {
        os << " (" << missing_files << " file(s) missing)";
    }
    os << std::endl;
    os << "Compression ratio: " << std::fixed << std::setprecision(4) << compression_ratio << std::endl;
    os << "Average chunk:     " << std::setprecision(1) << average_chunk_size << " bytes" << std::endl;
    os << std::defaultfloat;
}
