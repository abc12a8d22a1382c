/**
 * @file WasapiPlatform.hpp
 * @brief Abstract boundary between the WASAPI driver and the OS audio stack.
 *
 * WindowsPlatform binds these interfaces to COM, MMDevice and WASAPI.
 * Everything above this file is plain C++ and runs on any host.
 */

#ifndef HAL_WASAPI_PLATFORM_HPP
#define HAL_WASAPI_PLATFORM_HPP

#include <cstdint>
#include <memory>
#include "../ApartmentWorker.hpp"
#include "../DriverError.hpp"
#include "MixFormat.hpp"

namespace hal::wasapi {

// WaitForSingleObject's WAIT_OBJECT_0
constexpr uint32_t kWaitSignaled = 0;

// Subset of AUDIO_STREAM_CATEGORY. The driver always asks for Other.
enum class StreamCategory {
    Other,
    Media,
    Communications,
    GameMedia
};

struct ClientProperties {
    StreamCategory category = StreamCategory::Other;
    bool offload = false;
};

/**
 * @brief Auto-reset event the audio engine signals when buffer room is available.
 */
class ReadinessEvent {
public:
    virtual ~ReadinessEvent() = default;

    /**
     * @brief Block without timeout until the event is signaled.
     * @param wake_code Raw wait result; kWaitSignaled on a normal wake.
     */
    virtual Status wait(uint32_t& wake_code) = 0;

    /**
     * @brief Signal the event from software (used to wake the render thread on teardown).
     */
    virtual Status signal() = 0;

    /**
     * @brief OS handle registered with the audio client.
     */
    virtual void* native_handle() = 0;
};

/**
 * @brief Shared-mode audio client together with its render service.
 *
 * Setup and control calls must come from the apartment thread. current_padding,
 * get_buffer and release_buffer are called from the render thread.
 */
class AudioClient {
public:
    virtual ~AudioClient() = default;

    virtual Status set_properties(const ClientProperties& properties) = 0;

    /**
     * @param exact Set to false when the engine only offers a closest match.
     */
    virtual Status check_format(const MixFormat& format, bool& exact) = 0;

    /**
     * @brief Shared mode, event callback, no persisted session settings.
     */
    virtual Status initialize(const MixFormat& format) = 0;
    virtual Status buffer_size(uint32_t& frames) = 0;
    virtual Status open_render_service() = 0;
    virtual Status set_event(ReadinessEvent& event) = 0;
    virtual Status start() = 0;
    virtual Status stop() = 0;

    virtual Status current_padding(uint32_t& frames) = 0;
    virtual Status get_buffer(uint32_t frames, float*& data) = 0;
    virtual Status release_buffer(uint32_t frames) = 0;
};

/**
 * @brief An audio endpoint device.
 */
class Endpoint {
public:
    virtual ~Endpoint() = default;
    virtual Status activate(std::unique_ptr<AudioClient>& client) = 0;
};

/**
 * @brief Entry point into the OS audio stack.
 *
 * The Apartment half initializes the per-thread concurrency model that every
 * other call here requires.
 */
class Platform : public Apartment {
public:
    virtual Status default_render_endpoint(std::unique_ptr<Endpoint>& endpoint) = 0;
    virtual Status create_readiness_event(std::unique_ptr<ReadinessEvent>& event) = 0;
};

} // namespace hal::wasapi

#endif // HAL_WASAPI_PLATFORM_HPP
