#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "bytes.h"
#include "error.h"

struct archive;

namespace tekanim::core {

namespace fs = std::filesystem;

constexpr int k_default_max_files_per_archive = 226;

// One per-frame device file. `number` is its position in the source
// sequence; packing assigns new numbers.
struct FrameFile {
    int number = 0;
    std::string type = "BINARY";
    std::string name;
    Bytes data;
};

struct ArchiveOptions {
    int max_files = k_default_max_files_per_archive;
    // Adds a player program at file 1 of every archive, taking one slot.
    bool include_player = false;
    double automate_delay = 0.0;
    // Player to re-bound instead of generating a new one.
    std::optional<Bytes> player_template;
};

struct ArchiveEntry {
    std::string name;
    Bytes data;
};

bool validate_archive_options(const ArchiveOptions& options, Error& error);

// Frame files each archive holds: greedy fill, every archive but the last full.
std::vector<size_t> plan_archives(size_t frame_count, const ArchiveOptions& options);

// "a", "b", ..., "z", "aa", "ab", ...
std::string archive_suffix(size_t index);
fs::path archive_path(const std::string& prefix, size_t index);

// Archives are never overwritten: fails if any of the first `archive_count`
// archive paths for `prefix` already exists.
bool check_archive_outputs(const std::string& prefix, size_t archive_count, Error& error);

// One uncompressed ZIP file on disk, closed on destruction.
class ArchiveWriter {
public:
    ArchiveWriter() = default;
    ~ArchiveWriter();
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // Fails if `path` already exists.
    bool open(const fs::path& path, Error& error);
    bool add_entry(const std::string& name, const Bytes& data, Error& error);
    bool close(Error& error);
    bool is_open() const { return archive_ != nullptr; }

private:
    struct archive* archive_ = nullptr;
    fs::path path_;
};

// Streams an ordered frame sequence into capacity-bounded archives named
// <prefix>a.zip, <prefix>b.zip, ... Files are renumbered 1..k in each
// archive. Whatever is open is finalized on destruction.
class ArchivePacker {
public:
    ArchivePacker(std::string prefix, ArchiveOptions options);
    ~ArchivePacker();
    ArchivePacker(const ArchivePacker&) = delete;
    ArchivePacker& operator=(const ArchivePacker&) = delete;

    // Checks the options and that none of the archives for `frame_count`
    // frames exists yet.
    bool begin(size_t frame_count, Error& error);
    bool add(const FrameFile& frame, Error& error);
    bool finish(Error& error);

    const std::vector<fs::path>& archives() const { return archives_; }
    // Files in each archive, player included.
    const std::vector<size_t>& archive_sizes() const { return archive_sizes_; }

private:
    bool open_next(Error& error);
    bool close_current(Error& error);
    void abandon_current();
    int first_frame_number() const { return options_.include_player ? 2 : 1; }

    std::string prefix_;
    ArchiveOptions options_;
    size_t frames_per_archive_ = 0;
    ArchiveWriter writer_;
    size_t frames_in_current_ = 0;
    std::vector<fs::path> archives_;
    std::vector<size_t> archive_sizes_;
    bool started_ = false;
};

// Packs a pre-built sequence. The sequence must be numbered contiguously;
// gaps and duplicates are rejected before anything is written.
bool pack_sequence(std::vector<FrameFile> files, const std::string& prefix, const ArchiveOptions& options,
                   std::vector<fs::path>& archives, Error& error);

bool read_archive(const fs::path& path, std::vector<ArchiveEntry>& out, Error& error);

// Splits archive entries into the frame sequence and the player program, if
// any. With a player, the sequence is the range of files it plays.
bool extract_sequence(const std::vector<ArchiveEntry>& entries, std::vector<FrameFile>& frames,
                      std::optional<Bytes>& player, Error& error);

} // namespace tekanim::core
