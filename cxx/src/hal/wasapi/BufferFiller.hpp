/**
 * @file BufferFiller.hpp
 * @brief One render-thread fill cycle: top up the hardware ring buffer.
 */

#ifndef HAL_WASAPI_BUFFER_FILLER_HPP
#define HAL_WASAPI_BUFFER_FILLER_HPP

#include <cstdint>
#include <functional>
#include <span>
#include "../ScratchBuffer.hpp"
#include "WasapiPlatform.hpp"

namespace hal::wasapi {

/**
 * @brief Pulls interleaved float samples from a source and commits them to
 * the hardware buffer.
 *
 * Not thread-safe; the driver calls fill() with its fill mutex held.
 */
class BufferFiller {
public:
    /**
     * @brief Must fill the whole span synchronously, substituting silence if
     * nothing is playing.
     */
    using Source = std::function<void(std::span<float> output)>;

    BufferFiller(uint32_t capacity_frames, int channels, Source source);

    /**
     * @brief Fill every free frame of the hardware buffer.
     *
     * A buffer that is already full is not an error: @p frames_written is 0
     * and the source is not called. An exception thrown by the source is
     * returned as kUnexpected after the acquired region is released empty.
     */
    Status fill(AudioClient& client, uint32_t& frames_written);

    uint32_t capacity_frames() const { return capacity_frames_; }
    const ScratchBuffer& scratch() const { return scratch_; }

private:
    const uint32_t capacity_frames_;
    const int channels_;
    Source source_;
    ScratchBuffer scratch_;
};

} // namespace hal::wasapi

#endif // HAL_WASAPI_BUFFER_FILLER_HPP
