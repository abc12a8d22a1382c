#include <iostream>
#include <memory>
#include <thread>
#include <chrono>
#include <cmath>
#include "core/DriverConfig.hpp"
#include "core/Logger.hpp"
#include "hal/wasapi/WasapiDriver.hpp"
#include "hal/wasapi/WindowsPlatform.hpp"

namespace {

// Poll the render thread's error cell while waiting.
bool play_for(const hal::AudioDriver& driver, int milliseconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(milliseconds);
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto err = driver.current_error()) {
            std::cerr << "Render thread failed: " << err->message << std::endl;
            return false;
        }
        audio::AudioLogger::instance().flush();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    audio::DriverConfig config;
    if (argc > 1 && !audio::ConfigStore::load_from_file(config, argv[1])) {
        return 1;
    }
    if (auto err = audio::ConfigStore::validate(config)) {
        std::cerr << "Invalid config: " << err->message << std::endl;
        return 1;
    }

    std::cout << "--- Audible Verification: Playing " << config.tone_hz << "Hz for "
              << config.duration_ms << " ms ---" << std::endl;

    const int channels = config.channels;
    const double step = 2.0 * 3.14159265358979323846 * config.tone_hz / config.sample_rate;
    double phase = 0.0;

    std::unique_ptr<hal::WasapiDriver> driver;
    try {
        driver = std::make_unique<hal::WasapiDriver>(
            hal::wasapi::WindowsPlatform::instance(), config.sample_rate, channels,
            [&phase, step, channels](std::span<float> output) {
                for (size_t i = 0; i + channels <= output.size(); i += channels) {
                    const float sample = 0.2f * static_cast<float>(std::sin(phase));
                    for (int c = 0; c < channels; ++c) output[i + c] = sample;
                    phase = std::fmod(phase + step, 2.0 * 3.14159265358979323846);
                }
            });
    } catch (const hal::DriverException& e) {
        std::cerr << "Failed to start audio driver: " << e.what() << std::endl;
        return 1;
    }

    if (!play_for(*driver, config.duration_ms / 2)) return 1;

    std::cout << "Suspending..." << std::endl;
    if (auto err = driver->suspend()) return 1;
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    std::cout << "Resuming..." << std::endl;
    if (auto err = driver->resume()) return 1;
    if (!play_for(*driver, config.duration_ms / 2)) return 1;

    driver.reset();
    audio::AudioLogger::instance().flush();
    std::cout << "--- Test Complete ---" << std::endl;
    return 0;
}
