#include "archive_packer.h"

#include <algorithm>
#include <ctime>
#include <iostream>
#include <utility>

#include <archive.h>
#include <archive_entry.h>

#include "cli_parse.h"
#include "flash_drive.h"

namespace tekanim::core {
namespace {

constexpr size_t k_alphabet_size = 26;
constexpr size_t k_read_block_size = 10240;
constexpr int k_entry_permissions = 0644;

bool archive_failure(Error& error, struct archive* a, const std::string& what, const fs::path& path) {
    std::string message = what + " " + to_quoted(path.string());
    const char* detail = a != nullptr ? archive_error_string(a) : nullptr;
    if (detail != nullptr) {
        message += ": ";
        message += detail;
    }
    return fail(error, ErrorKind::Output, message);
}

} // namespace

bool validate_archive_options(const ArchiveOptions& options, Error& error) {
    if (options.max_files <= 0) {
        return fail(error, ErrorKind::Output,
                    "max files per archive must be positive, got " + std::to_string(options.max_files));
    }
    if (options.include_player && options.max_files < 2) {
        return fail(error, ErrorKind::Output,
                    "max files per archive must leave room for a frame next to the player program");
    }
    return true;
}

std::vector<size_t> plan_archives(size_t frame_count, const ArchiveOptions& options) {
    std::vector<size_t> sizes;
    const size_t per_archive = static_cast<size_t>(options.max_files) - (options.include_player ? 1 : 0);
    if (per_archive == 0) {
        return sizes;
    }
    for (size_t remaining = frame_count; remaining > 0;) {
        const size_t take = std::min(remaining, per_archive);
        sizes.push_back(take);
        remaining -= take;
    }
    return sizes;
}

std::string archive_suffix(size_t index) {
    std::string suffix;
    size_t n = index + 1;
    while (n > 0) {
        --n;
        suffix.insert(suffix.begin(), static_cast<char>('a' + n % k_alphabet_size));
        n /= k_alphabet_size;
    }
    return suffix;
}

fs::path archive_path(const std::string& prefix, size_t index) {
    return fs::path(prefix + archive_suffix(index) + ".zip");
}

bool check_archive_outputs(const std::string& prefix, size_t archive_count, Error& error) {
    for (size_t i = 0; i < archive_count; ++i) {
        const fs::path path = archive_path(prefix, i);
        std::error_code ec;
        if (fs::exists(path, ec) || ec) {
            return fail(error, ErrorKind::Output,
                        "archive " + to_quoted(path.string()) + " already exists; refusing to overwrite it");
        }
    }
    return true;
}

ArchiveWriter::~ArchiveWriter() {
    if (archive_ != nullptr) {
        Error error;
        if (!close(error)) {
            std::cerr << "Warning: " << format_error(error) << std::endl;
        }
    }
}

bool ArchiveWriter::open(const fs::path& path, Error& error) {
    if (archive_ != nullptr) {
        return fail(error, ErrorKind::Output, "archive " + to_quoted(path_.string()) + " is still open");
    }
    std::error_code ec;
    if (fs::exists(path, ec) || ec) {
        return fail(error, ErrorKind::Output,
                    "archive " + to_quoted(path.string()) + " already exists; refusing to overwrite it");
    }
    struct archive* a = archive_write_new();
    if (a == nullptr) {
        return fail(error, ErrorKind::Output, "failed to create archive " + to_quoted(path.string()));
    }
    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        archive_failure(error, a, "failed to set zip format for", path);
        archive_write_free(a);
        return false;
    }
    if (archive_write_zip_set_compression_store(a) != ARCHIVE_OK) {
        archive_failure(error, a, "failed to disable compression for", path);
        archive_write_free(a);
        return false;
    }
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        archive_failure(error, a, "failed to open", path);
        archive_write_free(a);
        return false;
    }
    archive_ = a;
    path_ = path;
    return true;
}

bool ArchiveWriter::add_entry(const std::string& name, const Bytes& data, Error& error) {
    if (archive_ == nullptr) {
        return fail(error, ErrorKind::Output, "no archive open for entry " + to_quoted(name));
    }
    struct archive_entry* entry = archive_entry_new();
    if (entry == nullptr) {
        return fail(error, ErrorKind::Output, "failed to create archive entry " + to_quoted(name));
    }
    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, k_entry_permissions);
    archive_entry_set_mtime(entry, std::time(nullptr), 0);

    if (archive_write_header(archive_, entry) != ARCHIVE_OK) {
        archive_entry_free(entry);
        return archive_failure(error, archive_, "failed to write entry header in", path_);
    }
    archive_entry_free(entry);

    if (!data.empty()
        && archive_write_data(archive_, data.data(), data.size()) != static_cast<la_ssize_t>(data.size())) {
        return archive_failure(error, archive_, "failed to write entry data in", path_);
    }
    return true;
}

bool ArchiveWriter::close(Error& error) {
    if (archive_ == nullptr) {
        return true;
    }
    struct archive* a = archive_;
    archive_ = nullptr;
    bool ok = true;
    if (archive_write_close(a) != ARCHIVE_OK) {
        ok = archive_failure(error, a, "failed to close", path_);
    }
    archive_write_free(a);
    return ok;
}

ArchivePacker::ArchivePacker(std::string prefix, ArchiveOptions options)
    : prefix_(std::move(prefix)), options_(std::move(options)) {}

ArchivePacker::~ArchivePacker() {
    if (writer_.is_open()) {
        Error error;
        if (!close_current(error)) {
            std::cerr << "Warning: " << format_error(error) << std::endl;
        }
    }
}

bool ArchivePacker::begin(size_t frame_count, Error& error) {
    if (!validate_archive_options(options_, error)) {
        return false;
    }
    if (!check_archive_outputs(prefix_, plan_archives(frame_count, options_).size(), error)) {
        return false;
    }
    frames_per_archive_ = static_cast<size_t>(options_.max_files) - (options_.include_player ? 1 : 0);
    started_ = true;
    return true;
}

bool ArchivePacker::add(const FrameFile& frame, Error& error) {
    if (!started_) {
        return fail(error, ErrorKind::Output, "archive packer used before begin");
    }
    if (writer_.is_open() && frames_in_current_ == frames_per_archive_) {
        if (!close_current(error)) {
            return false;
        }
    }
    if (!writer_.is_open() && !open_next(error)) {
        return false;
    }
    const int number = first_frame_number() + static_cast<int>(frames_in_current_);
    const std::string name = build_flash_drive_filename(number, frame.type, frame.name, frame.data.size());
    if (!writer_.add_entry(name, frame.data, error)) {
        return false;
    }
    ++frames_in_current_;
    return true;
}

bool ArchivePacker::finish(Error& error) {
    return close_current(error);
}

bool ArchivePacker::open_next(Error& error) {
    const fs::path path = archive_path(prefix_, archives_.size());
    if (!writer_.open(path, error)) {
        return false;
    }
    archives_.push_back(path);
    frames_in_current_ = 0;
    return true;
}

// The player is written last so its bounds match the frames actually present.
bool ArchivePacker::close_current(Error& error) {
    if (!writer_.is_open()) {
        return true;
    }
    size_t files = frames_in_current_;
    if (options_.include_player) {
        const int first = first_frame_number();
        const int last = first + static_cast<int>(frames_in_current_) - 1;
        Bytes player;
        if (options_.player_template) {
            player = *options_.player_template;
            if (!set_player_program_bounds(player, first, last)) {
                abandon_current();
                return fail(error, ErrorKind::Output, "player program has no frame bounds to update");
            }
        } else {
            player = build_player_program(first, last, options_.automate_delay);
        }
        const std::string name =
            build_flash_drive_filename(k_player_file_number, k_player_file_type, k_player_name, player.size());
        if (!writer_.add_entry(name, player, error)) {
            abandon_current();
            return false;
        }
        ++files;
    }
    if (!writer_.close(error)) {
        return false;
    }
    archive_sizes_.push_back(files);
    return true;
}

void ArchivePacker::abandon_current() {
    Error close_error;
    if (!writer_.close(close_error)) {
        std::cerr << "Warning: " << format_error(close_error) << std::endl;
    }
}

bool pack_sequence(std::vector<FrameFile> files, const std::string& prefix, const ArchiveOptions& options,
                   std::vector<fs::path>& archives, Error& error) {
    if (!validate_archive_options(options, error)) {
        return false;
    }
    if (files.empty()) {
        return fail(error, ErrorKind::Output, "no frame files to pack");
    }
    std::ranges::stable_sort(files, {}, &FrameFile::number);
    const int first = files.front().number;
    for (size_t i = 0; i < files.size(); ++i) {
        const int expected = first + static_cast<int>(i);
        if (files[i].number == expected) {
            continue;
        }
        if (files[i].number < expected) {
            return fail(error, ErrorKind::Output, "frame file " + std::to_string(files[i].number) + " appears twice");
        }
        return fail(error, ErrorKind::Output, "frame file " + std::to_string(expected) + " is missing");
    }

    ArchivePacker packer(prefix, options);
    if (!packer.begin(files.size(), error)) {
        return false;
    }
    for (const auto& file : files) {
        if (!packer.add(file, error)) {
            return false;
        }
    }
    if (!packer.finish(error)) {
        return false;
    }
    archives = packer.archives();
    return true;
}

bool read_archive(const fs::path& path, std::vector<ArchiveEntry>& out, Error& error) {
    struct archive* a = archive_read_new();
    if (a == nullptr) {
        return fail(error, ErrorKind::Output, "failed to create archive reader");
    }
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, path.string().c_str(), k_read_block_size) != ARCHIVE_OK) {
        archive_failure(error, a, "failed to open", path);
        archive_read_free(a);
        return false;
    }

    std::vector<ArchiveEntry> entries;
    struct archive_entry* entry = nullptr;
    int status = ARCHIVE_OK;
    while ((status = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        ArchiveEntry parsed;
        const char* name = archive_entry_pathname(entry);
        parsed.name = name != nullptr ? name : "";
        char buffer[k_read_block_size];
        la_ssize_t got = 0;
        while ((got = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
            parsed.data.insert(parsed.data.end(), buffer, buffer + got);
        }
        if (got < 0) {
            archive_failure(error, a, "failed to read entry " + to_quoted(parsed.name) + " from", path);
            archive_read_free(a);
            return false;
        }
        entries.push_back(std::move(parsed));
    }
    if (status != ARCHIVE_EOF) {
        archive_failure(error, a, "failed to read", path);
        archive_read_free(a);
        return false;
    }
    archive_read_free(a);
    out = std::move(entries);
    return true;
}

bool extract_sequence(const std::vector<ArchiveEntry>& entries, std::vector<FrameFile>& frames,
                      std::optional<Bytes>& player, Error& error) {
    std::vector<FrameFile> files;
    std::optional<Bytes> found_player;
    for (const auto& entry : entries) {
        FlashDriveName name;
        if (!parse_flash_drive_filename(entry.name, name)) {
            return fail(error, ErrorKind::Output, "unrecognised archive entry name " + to_quoted(entry.name));
        }
        if (is_player_name(name.name)) {
            if (found_player) {
                return fail(error, ErrorKind::Output, "archive holds more than one player program");
            }
            found_player = entry.data;
            continue;
        }
        files.push_back({.number = name.number, .type = name.type, .name = name.name, .data = entry.data});
    }
    std::ranges::stable_sort(files, {}, &FrameFile::number);

    if (found_player) {
        int first = 0;
        int last = 0;
        if (!get_player_program_bounds(*found_player, first, last)) {
            return fail(error, ErrorKind::Output, "player program has no frame bounds");
        }
        std::vector<FrameFile> played;
        for (int number = first; number <= last; ++number) {
            auto it = std::ranges::find(files, number, &FrameFile::number);
            if (it == files.end()) {
                return fail(error, ErrorKind::Output, "frame file " + std::to_string(number) + " is missing");
            }
            played.push_back(*it);
        }
        files = std::move(played);
    }

    frames = std::move(files);
    player = std::move(found_player);
    return true;
}

} // namespace tekanim::core
