/**
 * @file MixFormat.hpp
 * @brief The float stream format the WASAPI driver asks the shared-mode engine for.
 */

#ifndef HAL_WASAPI_MIX_FORMAT_HPP
#define HAL_WASAPI_MIX_FORMAT_HPP

#include <cstdint>
#include "../DriverError.hpp"

namespace hal::wasapi {

// ksmedia.h speaker positions
constexpr uint32_t kSpeakerFrontLeft   = 0x1;
constexpr uint32_t kSpeakerFrontRight  = 0x2;
constexpr uint32_t kSpeakerFrontCenter = 0x4;

constexpr uint16_t kFloatBitsPerSample = 32;

/**
 * @brief Platform-neutral view of a WAVEFORMATEXTENSIBLE with an IEEE float subformat.
 */
struct MixFormat {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    uint16_t bits_per_sample = kFloatBitsPerSample;
    uint16_t valid_bits_per_sample = kFloatBitsPerSample;
    uint16_t block_align = 0;
    uint32_t avg_bytes_per_sec = 0;
    uint32_t channel_mask = 0;

    bool operator==(const MixFormat&) const = default;
};

/**
 * @brief Speaker mask for a channel count, 0 when the count is unsupported.
 */
uint32_t channel_mask_for(int channels);

/**
 * @brief Build the 32-bit float format for the requested stream.
 *
 * Only mono and stereo are supported; any other channel count, or a
 * non-positive sample rate, is rejected with kInvalidArgument.
 */
Status build_float_format(int sample_rate, int channels, MixFormat& format);

} // namespace hal::wasapi

#endif // HAL_WASAPI_MIX_FORMAT_HPP
