/**
 * @file WindowsPlatform.hpp
 * @brief COM / MMDevice / WASAPI binding of the driver's platform boundary.
 */

#ifndef HAL_WASAPI_WINDOWS_PLATFORM_HPP
#define HAL_WASAPI_WINDOWS_PLATFORM_HPP

#include "WasapiPlatform.hpp"

namespace hal::wasapi {

/**
 * @brief Multithreaded-apartment COM, default console render endpoint,
 * IAudioClient2 in shared event mode and a Win32 auto-reset event.
 */
class WindowsPlatform : public Platform {
public:
    static WindowsPlatform& instance() {
        static WindowsPlatform inst;
        return inst;
    }

    Status enter_apartment() override;
    void leave_apartment() override;
    Status default_render_endpoint(std::unique_ptr<Endpoint>& endpoint) override;
    Status create_readiness_event(std::unique_ptr<ReadinessEvent>& event) override;

private:
    WindowsPlatform() = default;
};

} // namespace hal::wasapi

#endif // HAL_WASAPI_WINDOWS_PLATFORM_HPP
