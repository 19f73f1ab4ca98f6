#include "device_emitter.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <string>

#include "rasterizer.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace tekanim::core {
namespace {

constexpr uint8_t k_tek_group_separator = 0x1d; // GS: next point is a move
constexpr uint8_t k_tek_unit_separator = 0x1f;  // US: back to alpha mode
constexpr uint8_t k_tape_record_flag = 0x40;
constexpr int k_png_channels = 3;

// Calls `point` for every stroke point with move=true on the first point of a
// stroke. A single-point stroke is a move and a draw to the same spot.
template <typename PointFn>
void for_each_command(const std::vector<DeviceStroke>& strokes, PointFn point) {
    for (const auto& stroke : strokes) {
        if (stroke.empty()) {
            continue;
        }
        point(stroke.front(), true);
        if (stroke.size() == 1) {
            point(stroke.front(), false);
            continue;
        }
        for (size_t i = 1; i < stroke.size(); ++i) {
            point(stroke[i], false);
        }
    }
}

} // namespace

bool to_device_strokes(const Strokes& strokes, const DeviceProfile& profile, const EmitOptions& options,
                       std::vector<DeviceStroke>& out, Error& error) {
    std::vector<DeviceStroke> device;
    device.reserve(strokes.size());
    for (const auto& stroke : strokes) {
        DeviceStroke converted;
        converted.reserve(stroke.size());
        for (const auto& p : stroke) {
            const double x = std::round(p.x + options.origin_shift.x);
            const double y = std::round(p.y + options.origin_shift.y);
            if (x < 0.0 || y < 0.0 || x >= profile.screen_width || y >= profile.screen_height) {
                std::ostringstream message;
                message << "point " << x << "," << y << " is off the " << profile.screen_width << "x"
                        << profile.screen_height << " screen of profile '" << profile.name << "'";
                return fail(error, ErrorKind::Collaborator, message.str());
            }
            converted.push_back({static_cast<int>(x), static_cast<int>(y)});
        }
        if (!converted.empty()) {
            device.push_back(std::move(converted));
        }
    }
    out = std::move(device);
    return true;
}

// Four bytes per point: high y, low y, high x, low x, five bits each.
Bytes encode_tek4010(const std::vector<DeviceStroke>& strokes) {
    Bytes out;
    for_each_command(strokes, [&](DevicePoint p, bool move) {
        if (move) {
            out.push_back(k_tek_group_separator);
        }
        out.push_back(static_cast<uint8_t>(0x20 | ((p.y >> 5) & 0x1f)));
        out.push_back(static_cast<uint8_t>(0x60 | (p.y & 0x1f)));
        out.push_back(static_cast<uint8_t>(0x20 | ((p.x >> 5) & 0x1f)));
        out.push_back(static_cast<uint8_t>(0x40 | (p.x & 0x1f)));
    });
    out.push_back(k_tek_unit_separator);
    return out;
}

// Three bytes per point: move flag with the top three bits of x and y, then
// the low seven bits of x, then of y.
Bytes encode_tek4050r12(const std::vector<DeviceStroke>& strokes) {
    Bytes out;
    for_each_command(strokes, [&](DevicePoint p, bool move) {
        out.push_back(static_cast<uint8_t>((move ? 0x40 : 0x00) | (((p.x >> 7) & 0x7) << 3)
                                           | ((p.y >> 7) & 0x7)));
        out.push_back(static_cast<uint8_t>(p.x & 0x7f));
        out.push_back(static_cast<uint8_t>(p.y & 0x7f));
    });
    return out;
}

// Each record after the first repeats the last point of the previous one, with
// the move flag set, so drawing resumes where it stopped. Records carry a
// two-byte length header and a trailing zero; an "X" record ends the stream.
Bytes tek4050r12_to_tape_records(const Bytes& commands) {
    std::vector<Bytes> records;
    for (size_t pos = 0; pos < commands.size(); pos += k_tape_record_size) {
        const size_t end = std::min(commands.size(), pos + k_tape_record_size);
        records.emplace_back(commands.begin() + static_cast<std::ptrdiff_t>(pos),
                             commands.begin() + static_cast<std::ptrdiff_t>(end));
    }
    for (size_t i = 1; i < records.size(); ++i) {
        const Bytes& last = records[i - 1];
        const size_t n = last.size();
        Bytes prefix = {static_cast<uint8_t>(last[n - 3] | k_tape_record_flag), last[n - 2], last[n - 1]};
        records[i].insert(records[i].begin(), prefix.begin(), prefix.end());
    }

    Bytes out;
    for (const auto& record : records) {
        out.push_back(static_cast<uint8_t>(k_tape_record_flag | ((record.size() >> 8) & 0xff)));
        out.push_back(static_cast<uint8_t>(record.size() & 0xff));
        out.insert(out.end(), record.begin(), record.end());
        out.push_back(0x00);
    }
    const Bytes terminator = {k_tape_record_flag, 0x01, 'X', 'h'};
    out.insert(out.end(), terminator.begin(), terminator.end());
    return out;
}

bool encode_png(const Strokes& strokes, int width, int height, Bytes& out, Error& error) {
    const RasterFrame frame = rasterize(strokes, width, height);

    auto write_callback = [](void* context, void* data, int size) {
        auto* bytes = static_cast<Bytes*>(context);
        const auto* begin = static_cast<const uint8_t*>(data);
        bytes->insert(bytes->end(), begin, begin + size);
    };

    Bytes png;
    if (stbi_write_png_to_func(write_callback, &png, frame.width, frame.height, k_png_channels,
                               frame.pixels.data(), frame.width * k_png_channels) == 0) {
        return fail(error, ErrorKind::Collaborator, "failed to encode PNG frame");
    }
    out = std::move(png);
    return true;
}

bool emit_frame(const Scene& scene, const DeviceProfile& profile, const EmitOptions& options, Bytes& out,
                Error& error) {
    std::vector<DeviceStroke> device;
    if (!to_device_strokes(scene.strokes, profile, options, device, error)) {
        return false;
    }
    switch (profile.encoding) {
    case DeviceEncoding::Tek4010:
        out = encode_tek4010(device);
        return true;
    case DeviceEncoding::Tek4050R12:
        out = tek4050r12_to_tape_records(encode_tek4050r12(device));
        return true;
    case DeviceEncoding::Png: {
        Strokes shifted;
        shifted.reserve(device.size());
        for (const auto& stroke : device) {
            Stroke s;
            s.reserve(stroke.size());
            for (const auto& p : stroke) {
                s.push_back({static_cast<double>(p.x), static_cast<double>(p.y)});
            }
            shifted.push_back(std::move(s));
        }
        return encode_png(shifted, profile.screen_width, profile.screen_height, out, error);
    }
    }
    return fail(error, ErrorKind::Collaborator, "unsupported device encoding");
}

} // namespace tekanim::core
