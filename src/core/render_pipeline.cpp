#include "render_pipeline.h"

#include <iostream>

#include "compositor.h"
#include "flash_drive.h"
#include "rasterizer.h"

namespace tekanim::core {

unsigned int resolve_worker_count(unsigned int requested, int frame_count) {
    unsigned int worker_count = requested > 0 ? requested : std::thread::hardware_concurrency();
    if (worker_count == 0) {
        worker_count = 1;
    }
    return std::min<unsigned int>(worker_count, static_cast<unsigned int>(std::max(1, frame_count)));
}

bool render_vector_archives(const Timeline& timeline, const SourceLibrary& sources, const VectorArchiveSet& target,
                            const PipelineOptions& options, RenderReport& report, Error& error) {
    // Configuration problems surface before any frame is rendered.
    ArchivePacker packer(target.prefix, target.archive);
    if (!packer.begin(static_cast<size_t>(std::max(0, timeline.frame_count)), error)) {
        return false;
    }

    auto produce = [&](int frame, FrameFile& out, Error& frame_error) {
        Scene scene;
        if (!compose(timeline, sources, frame, scene, frame_error)) {
            return false;
        }
        out.number = frame + 1;
        out.type = target.profile.file_type;
        out.name = frame_entry_name(frame);
        return emit_frame(scene, target.profile, target.emit, out.data, frame_error);
    };
    int consumed = 0;
    auto consume = [&](int, FrameFile&& file, Error& frame_error) {
        if (!packer.add(file, frame_error)) {
            return false;
        }
        ++consumed;
        return true;
    };

    const bool ok = for_each_frame_ordered<FrameFile>(timeline.frame_count, options, produce, consume, error);
    report.frames_rendered = consumed;
    if (ok) {
        if (!packer.finish(error)) {
            return false;
        }
    } else {
        Error close_error;
        if (!packer.finish(close_error)) {
            std::cerr << "Warning: " << format_error(close_error) << std::endl;
        }
    }
    report.archives = packer.archives();
    report.archive_sizes = packer.archive_sizes();
    return ok;
}

bool render_raster_frames(const Timeline& timeline, const SourceLibrary& sources, VideoEncoder& encoder, int width,
                          int height, const PipelineOptions& options, RenderReport& report, Error& error) {
    auto produce = [&](int frame, RasterFrame& out, Error& frame_error) {
        Scene scene;
        if (!compose(timeline, sources, frame, scene, frame_error)) {
            return false;
        }
        out = rasterize(scene.strokes, width, height);
        return true;
    };
    auto consume = [&](int, RasterFrame&& frame, Error& frame_error) {
        return encoder.append(frame, frame_error);
    };

    const bool ok = for_each_frame_ordered<RasterFrame>(timeline.frame_count, options, produce, consume, error);
    report.frames_rendered = encoder.frame_count();
    if (!ok) {
        Error close_error;
        if (!encoder.finalize(close_error)) {
            std::cerr << "Warning: " << format_error(close_error) << std::endl;
        }
        return false;
    }
    return encoder.finalize(error);
}

bool render_raster_video(const Timeline& timeline, const SourceLibrary& sources, const RasterVideo& target,
                         const PipelineOptions& options, RenderReport& report, Error& error) {
    VideoSettings settings;
    settings.output = target.output;
    settings.codec = target.codec;
    settings.ffmpeg_path = target.ffmpeg_path;
    settings.frame_rate = target.frame_rate.value_or(timeline.frame_rate);
    if (!raster_frame_size(timeline.canvas, settings.width, settings.height, error)) {
        return false;
    }

    FfmpegVideoEncoder encoder(settings);
    if (!encoder.open(error)) {
        return false;
    }
    report.video = target.output;
    return render_raster_frames(timeline, sources, encoder, settings.width, settings.height, options, report, error);
}

bool render_output(const Timeline& timeline, const SourceLibrary& sources, const OutputTarget& target,
                   const PipelineOptions& options, RenderReport& report, Error& error) {
    struct Dispatch {
        const Timeline& timeline;
        const SourceLibrary& sources;
        const PipelineOptions& options;
        RenderReport& report;
        Error& error;

        bool operator()(const RasterVideo& video) const {
            return render_raster_video(timeline, sources, video, options, report, error);
        }
        bool operator()(const VectorArchiveSet& archives) const {
            return render_vector_archives(timeline, sources, archives, options, report, error);
        }
    };
    return std::visit(Dispatch{timeline, sources, options, report, error}, target);
}

} // namespace tekanim::core
