/**
 * @file WasapiDriver.hpp
 * @brief Event-driven, shared-mode WASAPI implementation of the AudioDriver interface.
 */

#ifndef HAL_WASAPI_DRIVER_HPP
#define HAL_WASAPI_DRIVER_HPP

#include "../AudioDriver.hpp"
#include "../ApartmentWorker.hpp"
#include "../ErrorCell.hpp"
#include "BufferFiller.hpp"
#include "MixFormat.hpp"
#include "WasapiPlatform.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace hal {

/**
 * @brief WASAPI shared-mode output for the default render endpoint.
 *
 * Two threads cooperate:
 * - an ApartmentWorker that performs setup and every start/stop call, since
 *   client objects may only be driven from their apartment;
 * - a render thread that waits on the readiness event and tops up the
 *   hardware buffer from the InterleavedCallback on each wake.
 *
 * Fill cycles, suspend() and resume() all hold the same mutex, so playback
 * state never changes in the middle of a buffer write.
 *
 * The stream format is exactly the requested float format. If the shared
 * engine would only accept a different one, construction fails and the
 * caller should fall back to another driver.
 */
class WasapiDriver : public AudioDriver {
public:
    /**
     * @param platform OS binding; must outlive the driver.
     * @param sample_rate Requested sample rate in Hz.
     * @param num_channels 1 (mono) or 2 (stereo).
     * @param source Pull callback for interleaved samples.
     * @throws DriverException if any setup step fails. Nothing is left running.
     */
    WasapiDriver(wasapi::Platform& platform, int sample_rate, int num_channels, InterleavedCallback source);
    ~WasapiDriver() override;

    WasapiDriver(const WasapiDriver&) = delete;
    WasapiDriver& operator=(const WasapiDriver&) = delete;

    Status suspend() override;
    Status resume() override;
    std::optional<DriverError> current_error() const override;

    int sample_rate() const override { return static_cast<int>(mix_format_.sample_rate); }
    int block_size() const override { return static_cast<int>(buffer_frames_); }
    int channels() const override { return mix_format_.channels; }
    const wasapi::MixFormat& mix_format() const { return mix_format_; }

private:
    Status setup_on_apartment();
    void release_on_apartment();
    void render_thread_main();
    Status render_loop();
    Status write_once();
    void terminate_render(DriverError error);

    wasapi::Platform& platform_;
    wasapi::MixFormat mix_format_;
    InterleavedCallback source_;

    std::unique_ptr<ApartmentWorker> worker_;
    std::unique_ptr<wasapi::AudioClient> client_;
    std::unique_ptr<wasapi::ReadinessEvent> ready_event_;
    uint32_t buffer_frames_ = 0;
    std::unique_ptr<wasapi::BufferFiller> filler_;

    ErrorCell error_;
    std::mutex mutex_;
    std::atomic<bool> closing_{false};
    std::thread render_thread_;
};

} // namespace hal

#endif // HAL_WASAPI_DRIVER_HPP
