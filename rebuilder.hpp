#ifndef REBUILDER_HPP
#define REBUILDER_HPP

#include <cstdint>
#include <filesystem>

struct RebuildOptions {
    bool quiet = false;
};

// Reassembles the original file from a chunk directory into out_path.
// Output is staged in "<out_path>.partial" and only renamed into place once
// every chunk and the whole-file digest checked out; on failure the staged
// file is removed and RebuildIncomplete is thrown.
// Returns the number of bytes written.
uint64_t rebuild_file(const std::filesystem::path& chunk_dir, const std::filesystem::path& out_path,
                      const RebuildOptions& options = {});

#endif // REBUILDER_HPP
