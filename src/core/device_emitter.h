#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "bytes.h"
#include "compositor.h"
#include "device_profile.h"
#include "error.h"
#include "geometry.h"

namespace tekanim::core {

struct DevicePoint {
    int x = 0;
    int y = 0;
};
using DeviceStroke = std::vector<DevicePoint>;

// R12 command data is stored on tape in records of at most this many bytes.
constexpr size_t k_tape_record_size = 8175;

struct EmitOptions {
    // Added to every coordinate before it is rounded and bounds checked.
    Point origin_shift;
};

// Rounds to device coordinates and rejects any point outside the profile's
// screen (0 <= x < width, 0 <= y < height).
bool to_device_strokes(const Strokes& strokes, const DeviceProfile& profile, const EmitOptions& options,
                       std::vector<DeviceStroke>& out, Error& error);

Bytes encode_tek4010(const std::vector<DeviceStroke>& strokes);
Bytes encode_tek4050r12(const std::vector<DeviceStroke>& strokes);
Bytes tek4050r12_to_tape_records(const Bytes& commands);
bool encode_png(const Strokes& strokes, int width, int height, Bytes& out, Error& error);

// One per-frame device file payload for `scene`.
bool emit_frame(const Scene& scene, const DeviceProfile& profile, const EmitOptions& options, Bytes& out,
                Error& error);

} // namespace tekanim::core
