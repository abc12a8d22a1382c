/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform-specific audio output drivers.
 *
 * Hardware/OS audio code is kept strictly separate from the mixing engine:
 * a driver only ever sees the engine through a pull callback.
 */

#ifndef AUDIO_DRIVER_HPP
#define AUDIO_DRIVER_HPP

#include <functional>
#include <optional>
#include <span>
#include "DriverError.hpp"

namespace hal {

/**
 * @brief Abstract base class for audio output drivers.
 *
 * A driver is playing as soon as construction succeeds. Construction
 * failures are thrown as DriverException.
 */
class AudioDriver {
public:
    /**
     * @brief Pull callback for interleaved float audio.
     *
     * Called on the driver's render thread. It must fill the whole span
     * without blocking indefinitely.
     */
    using InterleavedCallback = std::function<void(std::span<float> output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Stop hardware playback.
     *
     * @return The failure of the underlying stop call, if any.
     */
    virtual Status suspend() = 0;

    /**
     * @brief Restart hardware playback after suspend().
     *
     * @return The failure of the underlying start call, if any.
     */
    virtual Status resume() = 0;

    /**
     * @brief First fatal error of the render thread.
     *
     * Poll this periodically; once set, the stream is dead and the driver
     * has to be destroyed and recreated.
     */
    virtual std::optional<DriverError> current_error() const = 0;

    /**
     * @brief Get the current sample rate.
     *
     * @return int Sample rate in Hz.
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Get the hardware buffer capacity.
     *
     * @return int Number of frames the hardware buffer holds.
     */
    virtual int block_size() const = 0;

    virtual int channels() const = 0;
};

} // namespace hal

#endif // AUDIO_DRIVER_HPP
