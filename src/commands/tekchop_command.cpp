// tekchop_command.cpp
// MIT License (c) 2026 Pedro

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "commands.h"
#include "core/archive_packer.h"
#include "core/cli_parse.h"
#include "core/error.h"


namespace {

using namespace tekanim::core;

struct ChopConfig {
    fs::path input_path;
    std::string output_prefix;
    int max_files = k_default_max_files_per_archive;
    bool quiet = false;
};

void print_usage() {
    std::cout << "Usage: tekchop [OPTIONS] <archive.zip>\n\n"
        << "Split one tape-emulator archive into archives of at most N files,\n"
        << "renumbering the files of each from 1. A player program found in the\n"
        << "input is copied to every output with its frame range updated.\n\n"
        << "Options:\n"
        << "  -p, --prefix PREFIX        Output prefix (default: input path without .zip)\n"
        << "  --max-files N              Files per archive (default: " << k_default_max_files_per_archive << ")\n"
        << "  --quiet                    Only report errors\n"
        << "  --help, -h                 Show this help message\n\n"
        << "Examples:\n"
        << "  tekchop movie.zip\n"
        << "  tekchop movie.zip -p out/movie_ --max-files 100\n";
}

} // namespace

int run_tekchop(int argc, char** argv) {
    ChopConfig config;
    bool show_help = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if ((arg == "-p" || arg == "--prefix") && i + 1 < argc) {
            config.output_prefix = argv[++i];
        } else if (arg == "--max-files" && i + 1 < argc) {
            if (!parse_int(argv[++i], config.max_files)) {
                std::cerr << "Error: Invalid max-files value: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg.empty() || arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return 1;
        } else if (config.input_path.empty()) {
            config.input_path = arg;
        } else {
            std::cerr << "Error: Too many arguments" << '\n';
            print_usage();
            return 1;
        }
    }

    if (show_help) {
        print_usage();
        return 0;
    }
    if (config.input_path.empty()) {
        std::cerr << "Error: Input archive path is required" << '\n';
        print_usage();
        return 1;
    }
    if (config.output_prefix.empty()) {
        config.output_prefix = (config.input_path.parent_path() / config.input_path.stem()).string();
    }

    Error error;
    std::vector<ArchiveEntry> entries;
    if (!read_archive(config.input_path, entries, error)) {
        std::cerr << "Error: " << format_error(error) << '\n';
        return 1;
    }

    std::vector<FrameFile> frames;
    std::optional<Bytes> player;
    if (!extract_sequence(entries, frames, player, error)) {
        std::cerr << "Error: " << format_error(error) << '\n';
        return 1;
    }

    ArchiveOptions options;
    options.max_files = config.max_files;
    options.include_player = player.has_value();
    options.player_template = player;

    std::vector<fs::path> archives;
    if (!pack_sequence(std::move(frames), config.output_prefix, options, archives, error)) {
        std::cerr << "Error: " << format_error(error) << '\n';
        return 1;
    }

    if (!config.quiet) {
        for (const auto& path : archives) {
            std::cout << "Wrote archive " << path.string() << "\n";
        }
    }
    return 0;
}
