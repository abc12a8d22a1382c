/**
 * @file WasapiDriver.cpp
 * @brief Shared-mode WASAPI output: apartment-thread setup/control plus an
 * event-driven render thread.
 */

#include "WasapiDriver.hpp"
#include "../../core/Logger.hpp"
#include "../../core/AudioSettings.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <system_error>

namespace hal {

WasapiDriver::WasapiDriver(wasapi::Platform& platform, int sample_rate, int num_channels, InterleavedCallback source)
    : platform_(platform)
    , source_(std::move(source))
{
    // Rejected before any platform call.
    if (auto err = wasapi::build_float_format(sample_rate, num_channels, mix_format_)) {
        std::cerr << err->message << std::endl;
        throw DriverException(*err);
    }
    if (!source_) {
        throw DriverException(make_error(error_code::kInvalidArgument, "WASAPI: no sample source"));
    }

    worker_ = std::make_unique<ApartmentWorker>(platform_);

    Status status;
    worker_->submit([this, &status] {
        try {
            status = setup_on_apartment();
        } catch (const std::exception& e) {
            status = make_error(error_code::kUnexpected, std::string("WASAPI: setup failed: ") + e.what());
        }
    });
    if (status) {
        std::cerr << "WASAPI: Setup failed: " << status->message << std::endl;
        worker_->submit([this] { release_on_apartment(); });
        worker_.reset();
        throw DriverException(*status);
    }

    try {
        render_thread_ = std::thread(&WasapiDriver::render_thread_main, this);
    } catch (const std::system_error& e) {
        std::cerr << "WASAPI: Cannot start render thread (" << e.what() << ")" << std::endl;
        worker_->submit([this] {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (auto err = client_->stop()) {
                    std::cerr << "WASAPI: Stop failed: " << err->message << std::endl;
                }
            }
            release_on_apartment();
        });
        worker_.reset();
        throw DriverException(make_error(error_code::kUnexpected,
                                         std::string("WASAPI: cannot start render thread: ") + e.what()));
    }

    auto& settings = audio::AudioSettings::instance();
    settings.sample_rate = sample_rate;
    settings.block_size = static_cast<int>(buffer_frames_);
    settings.num_channels = num_channels;

    std::cout << "WASAPI: Playing " << sample_rate << " Hz, " << num_channels
              << " ch float32, buffer " << buffer_frames_ << " frames" << std::endl;
}

WasapiDriver::~WasapiDriver() {
    closing_.store(true, std::memory_order_release);

    // The client is stopped before the render thread goes away.
    worker_->submit([this] {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto err = client_->stop()) {
            std::cerr << "WASAPI: Stop on shutdown failed: " << err->message << std::endl;
        }
    });

    // Wake the render thread so it can observe closing_.
    if (auto err = ready_event_->signal()) {
        std::cerr << "WASAPI: Cannot wake render thread: " << err->message << std::endl;
    }
    if (render_thread_.joinable()) {
        render_thread_.join();
    }

    worker_->submit([this] {
        release_on_apartment();
        ready_event_.reset();
    });
    worker_.reset();
}

Status WasapiDriver::setup_on_apartment() {
    std::unique_ptr<wasapi::Endpoint> endpoint;
    if (auto err = platform_.default_render_endpoint(endpoint)) {
        return err;
    }

    if (auto err = endpoint->activate(client_)) {
        return err;
    }

    wasapi::ClientProperties properties;
    properties.category = wasapi::StreamCategory::Other;
    properties.offload = false;
    if (auto err = client_->set_properties(properties)) {
        return err;
    }

    // Stereo at 48 kHz is usually accepted as-is; mono and other rates often
    // are not. A substituted format is never used.
    bool exact = false;
    if (auto err = client_->check_format(mix_format_, exact)) {
        return err;
    }
    if (!exact) {
        return make_error(error_code::kUnsupportedFormat,
                          "WASAPI: the requested format is not supported (the engine offers a closest match instead)");
    }

    if (auto err = client_->initialize(mix_format_)) {
        return err;
    }

    if (auto err = client_->buffer_size(buffer_frames_)) {
        return err;
    }

    if (auto err = client_->open_render_service()) {
        return err;
    }

    if (auto err = platform_.create_readiness_event(ready_event_)) {
        return err;
    }
    if (auto err = client_->set_event(*ready_event_)) {
        return err;
    }

    filler_ = std::make_unique<wasapi::BufferFiller>(buffer_frames_, mix_format_.channels, source_);

    // Every failure up to and including Start() is fatal.
    if (auto err = client_->start()) {
        return err;
    }

    return std::nullopt;
}

void WasapiDriver::release_on_apartment() {
    filler_.reset();
    client_.reset();
}

void WasapiDriver::render_thread_main() {
    auto& logger = audio::AudioLogger::instance();

    // The render thread touches the same object family, so it needs its own
    // apartment membership.
    if (Status err = platform_.enter_apartment()) {
        terminate_render(std::move(*err));
        return;
    }

    logger.log_message("WASAPI", "Render loop started");
    try {
        if (Status err = render_loop()) {
            terminate_render(std::move(*err));
        } else {
            logger.log_message("WASAPI", "Render loop stopped");
        }
    } catch (const std::exception& e) {
        // Nothing may escape this thread; the failure is surfaced through current_error().
        terminate_render(make_error(error_code::kUnexpected,
                                    std::string("WASAPI: render thread failed: ") + e.what()));
    }

    platform_.leave_apartment();
}

Status WasapiDriver::render_loop() {
    for (;;) {
        uint32_t wake_code = 0;
        if (auto err = ready_event_->wait(wake_code)) {
            return err;
        }
        if (closing_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        if (wake_code != wasapi::kWaitSignaled) {
            return make_error(error_code::kUnexpected,
                              "WASAPI: readiness wait returned " + std::to_string(wake_code));
        }

        if (auto err = write_once()) {
            return err;
        }
    }
}

Status WasapiDriver::write_once() {
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t frames = 0;
    if (auto err = filler_->fill(*client_, frames)) {
        return err;
    }
    if (frames > 0) {
        audio::AudioLogger::instance().log_event("FILL_FRAMES", static_cast<float>(frames));
    }
    return std::nullopt;
}

void WasapiDriver::terminate_render(DriverError error) {
    auto& logger = audio::AudioLogger::instance();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_->stop()) {
            logger.log_message("WASAPI", "Stop after render failure failed");
        }
    }
    if (!error_.try_store(std::move(error))) {
        logger.log_message("WASAPI", "Later render failure discarded");
    }
    logger.log_message("WASAPI", "Render loop terminated");
}

Status WasapiDriver::suspend() {
    Status result;
    worker_->submit([this, &result] {
        std::lock_guard<std::mutex> lock(mutex_);
        result = client_->stop();
    });
    if (result) {
        std::cerr << "WASAPI: Suspend failed: " << result->message << std::endl;
    }
    return result;
}

Status WasapiDriver::resume() {
    Status result;
    worker_->submit([this, &result] {
        std::lock_guard<std::mutex> lock(mutex_);
        result = client_->start();
    });
    if (result) {
        std::cerr << "WASAPI: Resume failed: " << result->message << std::endl;
    }
    return result;
}

std::optional<DriverError> WasapiDriver::current_error() const {
    return error_.load();
}

} // namespace hal
