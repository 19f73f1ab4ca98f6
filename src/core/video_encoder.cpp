#include "video_encoder.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <utility>

#include "cli_parse.h"

namespace tekanim::core {
namespace {

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

bool is_valid_codec_name(const std::string& codec) {
    return !codec.empty() && std::ranges::all_of(codec, [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '-';
    });
}

FfmpegVideoEncoder::FfmpegVideoEncoder(VideoSettings settings) : settings_(std::move(settings)) {}

FfmpegVideoEncoder::~FfmpegVideoEncoder() {
    if (pipe_ != nullptr) {
        Error error;
        if (!finalize(error)) {
            std::cerr << "Warning: " << format_error(error) << std::endl;
        }
    }
}

std::string FfmpegVideoEncoder::command_line() const {
    std::ostringstream cmd;
    cmd << shell_quote(settings_.ffmpeg_path)
        << " -y -hide_banner -loglevel error"
        << " -f rawvideo"
        << " -pixel_format rgb24"
        << " -video_size " << settings_.width << "x" << settings_.height
        << " -framerate " << settings_.frame_rate
        << " -i -"
        << " -c:v " << settings_.codec
        << " -pix_fmt yuv420p "
        << shell_quote(settings_.output.string());
    return cmd.str();
}

bool FfmpegVideoEncoder::open(Error& error) {
    if (pipe_ != nullptr) {
        return fail(error, ErrorKind::Output, "video encoder is already open");
    }
    if (!is_valid_codec_name(settings_.codec)) {
        return fail(error, ErrorKind::Config, "invalid codec name " + to_quoted(settings_.codec));
    }
    if (settings_.width <= 0 || settings_.height <= 0 || settings_.width % 2 != 0 || settings_.height % 2 != 0) {
        return fail(error, ErrorKind::Output, "video frame size must be positive and even");
    }
    if (settings_.frame_rate <= 0.0) {
        return fail(error, ErrorKind::Output, "video frame rate must be positive");
    }
    const std::string cmd = command_line();
    pipe_ = popen(cmd.c_str(), "w");
    if (pipe_ == nullptr) {
        return fail(error, ErrorKind::Output, "failed to start ffmpeg: " + cmd);
    }
    frames_ = 0;
    return true;
}

bool FfmpegVideoEncoder::append(const RasterFrame& frame, Error& error) {
    if (pipe_ == nullptr) {
        return fail(error, ErrorKind::Output, "video encoder is not open");
    }
    if (frame.width != settings_.width || frame.height != settings_.height) {
        return fail(error, ErrorKind::Output,
                    "frame size " + std::to_string(frame.width) + "x" + std::to_string(frame.height)
                        + " does not match the video size " + std::to_string(settings_.width) + "x"
                        + std::to_string(settings_.height));
    }
    const size_t bytes = frame.pixels.size();
    const size_t written = fwrite(frame.pixels.data(), 1, bytes, pipe_);
    if (written != bytes) {
        return fail(error, ErrorKind::Output,
                    "ffmpeg pipe write short: " + std::to_string(written) + " / " + std::to_string(bytes)
                        + " bytes");
    }
    ++frames_;
    return true;
}

bool FfmpegVideoEncoder::finalize(Error& error) {
    if (pipe_ == nullptr) {
        return true;
    }
    FILE* pipe = pipe_;
    pipe_ = nullptr;
    const int status = pclose(pipe);
    if (status != 0) {
        return fail(error, ErrorKind::Output,
                    "ffmpeg exited with status " + std::to_string(status) + " writing "
                        + to_quoted(settings_.output.string()));
    }
    return true;
}

} // namespace tekanim::core
