#pragma once

#include <cstdio>
#include <filesystem>
#include <string>

#include "error.h"
#include "rasterizer.h"

namespace tekanim::core {

namespace fs = std::filesystem;

constexpr const char k_default_video_codec[] = "libx264";

struct VideoSettings {
    fs::path output;
    int width = k_min_raster_width;
    int height = k_min_raster_height;
    double frame_rate = 25.0;
    std::string codec = k_default_video_codec;
    std::string ffmpeg_path = "ffmpeg";
};

// Receives frames strictly in ascending order.
class VideoEncoder {
public:
    virtual ~VideoEncoder() = default;
    virtual bool append(const RasterFrame& frame, Error& error) = 0;
    virtual bool finalize(Error& error) = 0;
    virtual int frame_count() const = 0;
};

// Pipes rgb24 frames into an ffmpeg child process. The pipe is closed on
// destruction if finalize was never reached.
class FfmpegVideoEncoder : public VideoEncoder {
public:
    explicit FfmpegVideoEncoder(VideoSettings settings);
    ~FfmpegVideoEncoder() override;
    FfmpegVideoEncoder(const FfmpegVideoEncoder&) = delete;
    FfmpegVideoEncoder& operator=(const FfmpegVideoEncoder&) = delete;

    bool open(Error& error);
    bool append(const RasterFrame& frame, Error& error) override;
    bool finalize(Error& error) override;
    int frame_count() const override { return frames_; }

    std::string command_line() const;

private:
    VideoSettings settings_;
    FILE* pipe_ = nullptr;
    int frames_ = 0;
};

bool is_valid_codec_name(const std::string& codec);

} // namespace tekanim::core
