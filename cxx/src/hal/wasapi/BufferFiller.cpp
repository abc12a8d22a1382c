#include "BufferFiller.hpp"
#include <algorithm>
#include <exception>
#include <string>

namespace hal::wasapi {

BufferFiller::BufferFiller(uint32_t capacity_frames, int channels, Source source)
    : capacity_frames_(capacity_frames)
    , channels_(channels)
    , source_(std::move(source))
{
}

Status BufferFiller::fill(AudioClient& client, uint32_t& frames_written) {
    frames_written = 0;

    uint32_t padding = 0;
    if (auto err = client.current_padding(padding)) {
        return err;
    }

    // Woken slightly early; nothing to do until the next signal.
    if (padding >= capacity_frames_) {
        return std::nullopt;
    }
    const uint32_t frames = capacity_frames_ - padding;

    float* destination = nullptr;
    if (auto err = client.get_buffer(frames, destination)) {
        return err;
    }

    try {
        std::span<float> samples = scratch_.resize(static_cast<size_t>(frames) * static_cast<size_t>(channels_));
        source_(samples);
        std::copy(samples.begin(), samples.end(), destination);
    } catch (const std::exception& e) {
        scratch_.clear();
        DriverError failure = make_error(error_code::kUnexpected,
                                         std::string("WASAPI: render callback failed: ") + e.what());
        // Hand the region back uncommitted. The callback failure is the one reported.
        if (auto release_err = client.release_buffer(0)) {
            failure.message += "; release: " + release_err->message;
        }
        return failure;
    }

    if (auto err = client.release_buffer(frames)) {
        return err;
    }

    scratch_.clear();
    frames_written = frames;
    return std::nullopt;
}

} // namespace hal::wasapi
