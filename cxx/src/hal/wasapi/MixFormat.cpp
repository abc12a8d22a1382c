#include "MixFormat.hpp"
#include <string>

namespace hal::wasapi {

uint32_t channel_mask_for(int channels) {
    switch (channels) {
    case 1:
        return kSpeakerFrontCenter;
    case 2:
        return kSpeakerFrontLeft | kSpeakerFrontRight;
    default:
        return 0;
    }
}

Status build_float_format(int sample_rate, int channels, MixFormat& format) {
    const uint32_t mask = channel_mask_for(channels);
    if (mask == 0) {
        return make_error(error_code::kInvalidArgument,
                          "WASAPI: unsupported channel count " + std::to_string(channels));
    }
    if (sample_rate <= 0) {
        return make_error(error_code::kInvalidArgument,
                          "WASAPI: invalid sample rate " + std::to_string(sample_rate));
    }

    const int block_align = channels * kFloatBitsPerSample / 8;

    format = MixFormat{};
    format.sample_rate = static_cast<uint32_t>(sample_rate);
    format.channels = static_cast<uint16_t>(channels);
    format.block_align = static_cast<uint16_t>(block_align);
    format.avg_bytes_per_sec = static_cast<uint32_t>(sample_rate) * static_cast<uint32_t>(block_align);
    format.channel_mask = mask;
    return std::nullopt;
}

} // namespace hal::wasapi
