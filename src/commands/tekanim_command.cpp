// tekanim_command.cpp
// MIT License (c) 2026 Pedro

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "commands.h"
#include "core/archive_packer.h"
#include "core/cli_parse.h"
#include "core/device_profile.h"
#include "core/error.h"
#include "core/render_pipeline.h"
#include "core/script_parser.h"
#include "core/timeline.h"
#include "core/vector_source.h"
#include "core/video_encoder.h"


namespace {

using namespace tekanim::core;

constexpr int k_exit_cancelled = 130;

std::atomic<bool> g_cancel_requested{false};

extern "C" void handle_interrupt(int) {
    g_cancel_requested.store(true, std::memory_order_relaxed);
}

enum class OutputKind { Auto, Raster, VectorArchiveSet };

struct AnimateConfig {
    fs::path script_path;
    std::string output;
    OutputKind kind = OutputKind::Auto;
    std::optional<double> fps;
    std::string profile_name = k_default_profile_name;
    fs::path profiles_path;
    int max_files = k_default_max_files_per_archive;
    std::string codec = k_default_video_codec;
    bool player = false;
    double automate_delay = 0.0;
    Point origin_shift;
    unsigned int threads = 0;
    bool quiet = false;
};

bool parse_output_kind(const std::string& value, OutputKind& out) {
    const std::string lower = to_lower_copy(value);
    if (lower == "raster" || lower == "video") {
        out = OutputKind::Raster;
        return true;
    }
    if (lower == "vector-archive-set" || lower == "archives") {
        out = OutputKind::VectorArchiveSet;
        return true;
    }
    return false;
}

bool has_video_extension(const std::string& output) {
    const std::string ext = to_lower_copy(fs::path(output).extension().string());
    return ext == ".mp4" || ext == ".mkv" || ext == ".mov" || ext == ".avi" || ext == ".webm";
}

// "anim.zip" and "anim" both give the prefix "anim" (anima.zip, animb.zip, ...).
std::string archive_prefix_for(const std::string& output) {
    constexpr std::string_view zip_ext = ".zip";
    if (output.size() > zip_ext.size() && to_lower_copy(output).ends_with(zip_ext)) {
        return output.substr(0, output.size() - zip_ext.size());
    }
    return output;
}

void print_usage() {
    std::cout << "Usage: tekanim [OPTIONS] <script> -o <output>\n\n"
        << "Compile an animation script and render every frame to a video or to\n"
        << "tape-emulator archives of per-frame device files.\n\n"
        << "Options:\n"
        << "  -o, --output PATH          Video file, or archive prefix (PREFIXa.zip, PREFIXb.zip, ...)\n"
        << "  --output-kind KIND         raster | vector-archive-set (default: raster for video\n"
        << "                             file extensions, vector-archive-set otherwise)\n"
        << "  --fps R                    Video frame rate (default: the script's)\n"
        << "  --codec NAME               ffmpeg video codec (default: " << k_default_video_codec << ")\n"
        << "  --profile NAME             Device profile (default: " << k_default_profile_name << ")\n"
        << "  --profiles PATH            Device profiles file\n"
        << "  --max-files N              Files per archive (default: " << k_default_max_files_per_archive << ")\n"
        << "  --player                   Put a player program at file 1 of each archive\n"
        << "  --automate SECONDS         Player triggers a camera and pauses between frames\n"
        << "  --origin-shift DX,DY       Displace every device coordinate\n"
        << "  --threads N                Worker threads (default: 0 = auto)\n"
        << "  --quiet                    Only report errors\n"
        << "  --help, -h                 Show this help message\n\n"
        << "Examples:\n"
        << "  tekanim plane.anim -o plane.mp4\n"
        << "  tekanim plane.anim -o plane --player --max-files 226\n";
}

int report_failure(const Error& error, const fs::path& script_path) {
    std::cerr << "Error: " << format_error(error, script_path.string()) << '\n';
    return error.kind == ErrorKind::Cancelled ? k_exit_cancelled : 1;
}

} // namespace

int run_tekanim(int argc, char** argv) {
    AnimateConfig config;
    bool show_help = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.output = argv[++i];
        } else if (arg == "--output-kind" && i + 1 < argc) {
            if (!parse_output_kind(argv[++i], config.kind)) {
                std::cerr << "Error: Invalid output kind: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--fps" && i + 1 < argc) {
            double fps = 0.0;
            if (!parse_double(argv[++i], fps) || fps <= 0.0) {
                std::cerr << "Error: Invalid fps value: " << argv[i] << '\n';
                return 1;
            }
            config.fps = fps;
        } else if (arg == "--codec" && i + 1 < argc) {
            config.codec = argv[++i];
            if (!is_valid_codec_name(config.codec)) {
                std::cerr << "Error: Invalid codec name: " << config.codec << '\n';
                return 1;
            }
        } else if (arg == "--profile" && i + 1 < argc) {
            config.profile_name = argv[++i];
        } else if (arg == "--profiles" && i + 1 < argc) {
            config.profiles_path = argv[++i];
        } else if (arg == "--max-files" && i + 1 < argc) {
            if (!parse_int(argv[++i], config.max_files)) {
                std::cerr << "Error: Invalid max-files value: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--player") {
            config.player = true;
        } else if (arg == "--automate" && i + 1 < argc) {
            if (!parse_double(argv[++i], config.automate_delay) || config.automate_delay < 0.0) {
                std::cerr << "Error: Invalid automate delay: " << argv[i] << '\n';
                return 1;
            }
            config.player = true;
        } else if (arg == "--origin-shift" && i + 1 < argc) {
            if (!parse_double_pair(argv[++i], config.origin_shift.x, config.origin_shift.y)) {
                std::cerr << "Error: Invalid origin shift: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--threads" && i + 1 < argc) {
            if (!parse_non_negative_uint(argv[++i], config.threads)) {
                std::cerr << "Error: Invalid threads value: " << argv[i] << '\n';
                return 1;
            }
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg.empty() || arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << '\n';
            print_usage();
            return 1;
        } else if (config.script_path.empty()) {
            config.script_path = arg;
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
    if (config.script_path.empty()) {
        std::cerr << "Error: Script path is required" << '\n';
        print_usage();
        return 1;
    }
    if (config.output.empty()) {
        std::cerr << "Error: Output path is required" << '\n';
        print_usage();
        return 1;
    }
    if (config.kind == OutputKind::Auto) {
        config.kind = has_video_extension(config.output) ? OutputKind::Raster : OutputKind::VectorArchiveSet;
    }

    Error error;
    Timeline timeline;
    if (!parse_script_file(config.script_path, timeline, error)) {
        return report_failure(error, config.script_path);
    }

    SourceLibrary sources;
    if (!sources.load(timeline.source_paths(), error)) {
        return report_failure(error, config.script_path);
    }

    OutputTarget target;
    if (config.kind == OutputKind::Raster) {
        RasterVideo video;
        video.output = config.output;
        video.codec = config.codec;
        video.frame_rate = config.fps;
        target = video;
    } else {
        std::vector<DeviceProfile> profiles;
        if (!load_device_profiles(config.profiles_path, profiles, error)) {
            return report_failure(error, config.script_path);
        }
        const DeviceProfile* profile = find_profile(profiles, config.profile_name);
        if (profile == nullptr) {
            error = {.kind = ErrorKind::Config, .message = "unknown device profile '" + config.profile_name + "'"};
            return report_failure(error, config.script_path);
        }
        VectorArchiveSet archives;
        archives.prefix = archive_prefix_for(config.output);
        archives.profile = *profile;
        archives.archive.max_files = config.max_files;
        archives.archive.include_player = config.player;
        archives.archive.automate_delay = config.automate_delay;
        archives.emit.origin_shift = config.origin_shift;
        if (!validate_archive_options(archives.archive, error)) {
            return report_failure(error, config.script_path);
        }
        target = archives;
    }

    std::signal(SIGINT, handle_interrupt);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif

    PipelineOptions options;
    options.threads = config.threads;
    options.cancel = &g_cancel_requested;

    RenderReport report;
    const bool ok = render_output(timeline, sources, target, options, report, error);

    if (!config.quiet) {
        for (size_t i = 0; i < report.archives.size() && i < report.archive_sizes.size(); ++i) {
            std::cout << "Wrote archive " << report.archives[i].string() << " (" << report.archive_sizes[i]
                      << " files)\n";
        }
        if (!report.video.empty() && ok) {
            std::cout << "Encoded " << report.frames_rendered << " frames to " << report.video.string() << "\n";
        }
    }
    if (!ok) {
        return report_failure(error, config.script_path);
    }
    return 0;
}
