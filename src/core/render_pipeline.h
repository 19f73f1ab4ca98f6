#pragma once

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "archive_packer.h"
#include "device_emitter.h"
#include "device_profile.h"
#include "error.h"
#include "timeline.h"
#include "vector_source.h"
#include "video_encoder.h"

namespace tekanim::core {

namespace fs = std::filesystem;

constexpr size_t k_frames_per_worker_batch = 8;

struct RasterVideo {
    fs::path output;
    std::string codec = k_default_video_codec;
    // Overrides the timeline frame rate when set.
    std::optional<double> frame_rate;
    std::string ffmpeg_path = "ffmpeg";
};

struct VectorArchiveSet {
    std::string prefix;
    ArchiveOptions archive;
    DeviceProfile profile;
    EmitOptions emit;
};

// Selected once per run.
using OutputTarget = std::variant<RasterVideo, VectorArchiveSet>;

struct PipelineOptions {
    unsigned int threads = 0; // 0 = hardware concurrency
    size_t batch_size = 0;    // 0 = k_frames_per_worker_batch per worker
    // Checked between frames; set to stop the run.
    const std::atomic<bool>* cancel = nullptr;
};

struct RenderReport {
    int frames_rendered = 0;
    std::vector<fs::path> archives;
    std::vector<size_t> archive_sizes;
    fs::path video;
};

unsigned int resolve_worker_count(unsigned int requested, int frame_count);

// Runs `produce(frame, result, error)` on worker threads over disjoint frames
// and hands each result to `consume(frame, result, error)` on the calling
// thread in ascending frame order. Stops at the first failing frame (after
// consuming every frame before it) and records that frame in `error`.
template <typename Result, typename Produce, typename Consume>
bool for_each_frame_ordered(int frame_count, const PipelineOptions& options, Produce produce, Consume consume,
                            Error& error) {
    struct Slot {
        bool done = false;
        bool ok = false;
        Result value{};
        Error error;
    };

    auto cancelled = [&]() {
        return options.cancel != nullptr && options.cancel->load(std::memory_order_relaxed);
    };
    auto frame_failure = [&](Error& failed, int frame) {
        error = std::move(failed);
        error.frame = frame;
        return false;
    };

    const unsigned int worker_count = resolve_worker_count(options.threads, frame_count);
    const size_t batch_size =
        options.batch_size > 0 ? options.batch_size : static_cast<size_t>(worker_count) * k_frames_per_worker_batch;

    for (int batch_start = 0; batch_start < frame_count; batch_start += static_cast<int>(batch_size)) {
        if (cancelled()) {
            return fail(error, ErrorKind::Cancelled, "cancelled before frame " + std::to_string(batch_start));
        }
        const int batch_end = std::min(frame_count, batch_start + static_cast<int>(batch_size));
        std::vector<Slot> slots(static_cast<size_t>(batch_end - batch_start));

        std::atomic<size_t> next_index{0};
        std::atomic<bool> failed{false};
        auto work = [&]() {
            while (!failed.load(std::memory_order_relaxed) && !cancelled()) {
                const size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
                if (idx >= slots.size()) {
                    break;
                }
                Slot& slot = slots[idx];
                slot.ok = produce(batch_start + static_cast<int>(idx), slot.value, slot.error);
                slot.done = true;
                if (!slot.ok) {
                    failed.store(true, std::memory_order_relaxed);
                    break;
                }
            }
        };

        const unsigned int batch_workers =
            std::min<unsigned int>(worker_count, static_cast<unsigned int>(slots.size()));
        if (batch_workers <= 1) {
            work();
        } else {
            std::vector<std::thread> workers;
            workers.reserve(batch_workers);
            for (unsigned int i = 0; i < batch_workers; ++i) {
                workers.emplace_back(work);
            }
            for (auto& worker : workers) {
                worker.join();
            }
        }

        // Reorder stage: consume the finished prefix of the batch in frame order.
        for (size_t idx = 0; idx < slots.size(); ++idx) {
            const int frame = batch_start + static_cast<int>(idx);
            Slot& slot = slots[idx];
            if (!slot.done) {
                if (cancelled()) {
                    return fail(error, ErrorKind::Cancelled, "cancelled before frame " + std::to_string(frame));
                }
                // A later frame failed first and the workers stopped; this
                // frame still has to be produced before the failure counts.
                slot.ok = produce(frame, slot.value, slot.error);
                slot.done = true;
            }
            if (!slot.ok) {
                return frame_failure(slot.error, frame);
            }
            Error consume_error;
            if (!consume(frame, std::move(slot.value), consume_error)) {
                return frame_failure(consume_error, frame);
            }
        }
    }
    return true;
}

bool render_vector_archives(const Timeline& timeline, const SourceLibrary& sources, const VectorArchiveSet& target,
                            const PipelineOptions& options, RenderReport& report, Error& error);

// Appends every frame to `encoder` and finalizes it, also when a frame fails.
bool render_raster_frames(const Timeline& timeline, const SourceLibrary& sources, VideoEncoder& encoder, int width,
                          int height, const PipelineOptions& options, RenderReport& report, Error& error);

bool render_raster_video(const Timeline& timeline, const SourceLibrary& sources, const RasterVideo& target,
                         const PipelineOptions& options, RenderReport& report, Error& error);

bool render_output(const Timeline& timeline, const SourceLibrary& sources, const OutputTarget& target,
                   const PipelineOptions& options, RenderReport& report, Error& error);

} // namespace tekanim::core
