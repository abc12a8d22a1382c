#include <gtest/gtest.h>
#include "WasapiDriver.hpp"
#include "AudioSettings.hpp"
#include "Logger.hpp"
#include "FakePlatform.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace hal;

class WasapiDriverTest : public ::testing::Test {
protected:
    AudioDriver::InterleavedCallback recording_source() {
        return [this](std::span<float> output) {
            std::fill(output.begin(), output.end(), 0.25f);
            std::lock_guard<std::mutex> lock(pulls_mutex);
            pulls.push_back(output.size());
        };
    }

    std::vector<size_t> pulls_snapshot() {
        std::lock_guard<std::mutex> lock(pulls_mutex);
        return pulls;
    }

    std::unique_ptr<WasapiDriver> make_driver(int channels = 2) {
        return std::make_unique<WasapiDriver>(platform, 48000, channels, recording_source());
    }

    test::FakePlatform platform;
    std::mutex pulls_mutex;
    std::vector<size_t> pulls;
};

TEST_F(WasapiDriverTest, SetupRunsEveryStepInOrder) {
    auto driver = make_driver();

    const std::vector<std::string> expected = {
        "default_render_endpoint", "activate", "set_properties", "check_format",
        "initialize", "buffer_size", "open_render_service",
        "create_readiness_event", "set_event", "start"};
    auto calls = platform.hw.calls_snapshot();
    ASSERT_GE(calls.size(), expected.size());
    EXPECT_EQ(std::vector<std::string>(calls.begin(), calls.begin() + expected.size()), expected);

    EXPECT_EQ(driver->block_size(), 1024);
    EXPECT_EQ(driver->sample_rate(), 48000);
    EXPECT_EQ(driver->channels(), 2);
    EXPECT_EQ(platform.hw.format_initialized, driver->mix_format());
    EXPECT_EQ(platform.hw.format_initialized.channel_mask, 0x3u);
    EXPECT_EQ(platform.hw.format_initialized.block_align, 8);
    EXPECT_TRUE(platform.hw.started);
    EXPECT_FALSE(driver->current_error().has_value());

    auto& settings = audio::AudioSettings::instance();
    EXPECT_EQ(settings.block_size.load(), 1024);
    EXPECT_EQ(settings.num_channels.load(), 2);
}

TEST_F(WasapiDriverTest, WorkerAndRenderThreadEachHoldAnApartment) {
    {
        auto driver = make_driver();
        ASSERT_TRUE(test::wait_until([&] { return platform.apartment.enter_count() == 2; }));
    }
    EXPECT_EQ(platform.apartment.entered_threads.size(), 2u);
    EXPECT_NE(platform.apartment.entered_threads[0], platform.apartment.entered_threads[1]);
    EXPECT_EQ(platform.apartment.left_threads.size(), 2u);
    EXPECT_FALSE(platform.hw.started);
}

TEST_F(WasapiDriverTest, UnsupportedChannelCountRejectedBeforeAnyPlatformCall) {
    try {
        auto driver = make_driver(3);
        FAIL() << "construction should have thrown";
    } catch (const DriverException& e) {
        EXPECT_EQ(e.error().code, error_code::kInvalidArgument);
    }
    EXPECT_EQ(platform.apartment.enter_count(), 0);
    EXPECT_TRUE(platform.hw.calls_snapshot().empty());
}

TEST_F(WasapiDriverTest, ClosestFormatIsNotAccepted) {
    platform.hw.exact_format = false;

    try {
        auto driver = make_driver(1);
        FAIL() << "construction should have thrown";
    } catch (const DriverException& e) {
        EXPECT_EQ(e.error().code, error_code::kUnsupportedFormat);
    }
    EXPECT_EQ(platform.hw.format_checked.channel_mask, 0x4u);
    EXPECT_FALSE(platform.hw.called("initialize"));
    EXPECT_FALSE(platform.hw.called("start"));
    // Only the worker entered; no render thread was launched.
    EXPECT_EQ(platform.apartment.enter_count(), 1);
    EXPECT_EQ(platform.apartment.left_threads.size(), 1u);
}

TEST_F(WasapiDriverTest, ApartmentFailureFailsConstruction) {
    platform.apartment.fail_enter_at = 1;
    EXPECT_THROW(make_driver(), DriverException);
    EXPECT_TRUE(platform.hw.calls_snapshot().empty());
}

class WasapiSetupFailureTest : public WasapiDriverTest,
                               public ::testing::WithParamInterface<const char*> {};

TEST_P(WasapiSetupFailureTest, FailurePropagatesUnchangedAndNothingIsStarted) {
    const std::string step = GetParam();
    const DriverError injected = make_error(static_cast<int32_t>(0x88890004u), "injected " + step);
    platform.hw.fail(step, injected);

    try {
        auto driver = make_driver();
        FAIL() << "construction should have thrown";
    } catch (const DriverException& e) {
        EXPECT_EQ(e.error(), injected);
    }
    EXPECT_FALSE(platform.hw.started);
    if (step != "start") {
        EXPECT_FALSE(platform.hw.called("start"));
    }
    EXPECT_EQ(platform.apartment.enter_count(), 1);
}

INSTANTIATE_TEST_SUITE_P(SetupSteps, WasapiSetupFailureTest,
                         ::testing::Values("default_render_endpoint", "activate", "set_properties",
                                           "check_format", "initialize", "buffer_size",
                                           "open_render_service", "create_readiness_event",
                                           "set_event", "start"));

TEST_F(WasapiDriverTest, EachWakeFillsExactlyTheFreeFrames) {
    platform.hw.padding_script = {0, 512, 1024};
    auto driver = make_driver();

    for (int i = 0; i < 3; ++i) {
        ASSERT_FALSE(platform.event->signal().has_value());
    }
    ASSERT_TRUE(platform.hw.wait_for_padding_queries(3));

    // Stereo: two samples per frame; the third wake found the buffer full.
    EXPECT_EQ(pulls_snapshot(), (std::vector<size_t>{1024 * 2, 512 * 2}));
    {
        std::lock_guard<std::mutex> lock(platform.hw.mutex);
        EXPECT_EQ(platform.hw.committed_frames, (std::vector<uint32_t>{1024, 512}));
        EXPECT_FLOAT_EQ(platform.hw.hardware_buffer[0], 0.25f);
    }
    EXPECT_FALSE(driver->current_error().has_value());
}

TEST_F(WasapiDriverTest, WaitFailureTerminatesRenderLoop) {
    auto driver = make_driver();
    const DriverError failure = make_error(static_cast<int32_t>(0x80070006u), "wait failed");
    platform.event->push_failure(failure);

    ASSERT_TRUE(test::wait_until([&] { return driver->current_error().has_value(); }));
    EXPECT_EQ(*driver->current_error(), failure);
    EXPECT_TRUE(test::wait_until([&] { return !platform.hw.started; }));

    // A terminated loop no longer reacts to wakes.
    platform.event->signal();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(pulls_snapshot().empty());
}

TEST_F(WasapiDriverTest, UnexpectedWakeCodeTerminatesRenderLoop) {
    auto driver = make_driver();
    platform.event->push_code(0x102); // WAIT_TIMEOUT

    ASSERT_TRUE(test::wait_until([&] { return driver->current_error().has_value(); }));
    EXPECT_EQ(driver->current_error()->code, error_code::kUnexpected);
    EXPECT_TRUE(pulls_snapshot().empty());
}

TEST_F(WasapiDriverTest, FillFailureIsRecordedOnce) {
    const DriverError release_failure = make_error(static_cast<int32_t>(0x88890006u), "release failed");
    platform.hw.fail("release_buffer", release_failure);
    auto driver = make_driver();

    platform.event->signal();
    ASSERT_TRUE(test::wait_until([&] { return driver->current_error().has_value(); }));
    EXPECT_EQ(*driver->current_error(), release_failure);

    // A later failure cannot replace the first one.
    platform.hw.fail("release_buffer", make_error(error_code::kUnexpected, "second failure"));
    platform.event->signal();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(*driver->current_error(), release_failure);
}

TEST_F(WasapiDriverTest, RenderThreadApartmentFailureIsReported) {
    platform.apartment.fail_enter_at = 2;
    auto driver = make_driver();

    ASSERT_TRUE(test::wait_until([&] { return driver->current_error().has_value(); }));
    EXPECT_EQ(driver->current_error()->code, error_code::kUnexpected);
    EXPECT_TRUE(test::wait_until([&] { return !platform.hw.started; }));
}

TEST_F(WasapiDriverTest, SuspendAndResumeNeverInterruptAFill) {
    auto driver = std::make_unique<WasapiDriver>(platform, 48000, 2, [](std::span<float> output) {
        std::fill(output.begin(), output.end(), 0.0f);
        // Widen the window between GetBuffer and ReleaseBuffer.
        std::this_thread::sleep_for(std::chrono::microseconds(200));
    });

    std::atomic<bool> pumping{true};
    std::thread pump([&] {
        while (pumping) {
            platform.event->signal();
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    });

    for (int i = 0; i < 50; ++i) {
        EXPECT_FALSE(driver->suspend().has_value());
        EXPECT_FALSE(driver->resume().has_value());
    }

    ASSERT_TRUE(test::wait_until([&] {
        std::lock_guard<std::mutex> lock(platform.hw.mutex);
        return platform.hw.committed_frames.size() >= 10;
    }));
    pumping = false;
    pump.join();

    EXPECT_EQ(platform.hw.overlaps.load(), 0);
    EXPECT_FALSE(driver->current_error().has_value());
    EXPECT_TRUE(platform.hw.started);
}

TEST_F(WasapiDriverTest, SuspendFailureIsReturnedNotRecorded) {
    auto driver = make_driver();
    const DriverError stop_failure = make_error(static_cast<int32_t>(0x88890004u), "stop failed");
    platform.hw.fail("stop", stop_failure);

    auto result = driver->suspend();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, stop_failure);
    EXPECT_FALSE(driver->current_error().has_value());

    EXPECT_FALSE(driver->resume().has_value());
    EXPECT_FALSE(driver->current_error().has_value());
}

TEST_F(WasapiDriverTest, ResumeFailureIsReturned) {
    auto driver = make_driver();
    EXPECT_FALSE(driver->suspend().has_value());
    EXPECT_FALSE(platform.hw.started);

    platform.hw.fail("start", make_error(error_code::kNotInitialized, "start failed"));
    auto result = driver->resume();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->code, error_code::kNotInitialized);
    EXPECT_FALSE(driver->current_error().has_value());
}

TEST_F(WasapiDriverTest, SourceExceptionIsRecordedAsRenderError) {
    auto driver = std::make_unique<WasapiDriver>(platform, 48000, 2, [](std::span<float>) {
        throw std::runtime_error("engine failed");
    });

    platform.event->signal();
    ASSERT_TRUE(test::wait_until([&] { return driver->current_error().has_value(); }));
    EXPECT_EQ(driver->current_error()->code, error_code::kUnexpected);
    EXPECT_NE(driver->current_error()->message.find("engine failed"), std::string::npos);
    EXPECT_TRUE(test::wait_until([&] { return !platform.hw.started; }));
    EXPECT_FALSE(platform.hw.writing);

    driver.reset();
    // The render thread still left its apartment.
    EXPECT_EQ(platform.apartment.left_threads.size(), 2u);
}

TEST_F(WasapiDriverTest, ThrowingSetupStepReleasesOnTheWorker) {
    platform.hw.throw_on("initialize");

    try {
        auto driver = make_driver();
        FAIL() << "construction should have thrown";
    } catch (const DriverException& e) {
        EXPECT_EQ(e.error().code, error_code::kUnexpected);
        EXPECT_NE(e.error().message.find("fake initialize threw"), std::string::npos);
    }
    EXPECT_FALSE(platform.hw.called("start"));
    EXPECT_EQ(platform.apartment.enter_count(), 1);
    EXPECT_EQ(platform.apartment.left_threads.size(), 1u);
}

TEST_F(WasapiDriverTest, RequestsOtherCategoryWithoutOffload) {
    auto driver = make_driver();

    std::lock_guard<std::mutex> lock(platform.hw.mutex);
    EXPECT_EQ(platform.hw.properties_set.category, wasapi::StreamCategory::Other);
    EXPECT_FALSE(platform.hw.properties_set.offload);
}

TEST_F(WasapiDriverTest, TeardownLeavesTelemetryForTheCaller) {
    auto& logger = audio::AudioLogger::instance();
    while (logger.pop_entry()) {}

    {
        auto driver = make_driver();
        platform.event->signal();
        ASSERT_TRUE(platform.hw.wait_for_padding_queries(1));
    }

    bool saw_fill = false;
    bool saw_stop = false;
    while (auto entry = logger.pop_entry()) {
        if (std::string(entry->tag) == "FILL_FRAMES") saw_fill = true;
        if (std::string(entry->message) == "Render loop stopped") saw_stop = true;
    }
    EXPECT_TRUE(saw_fill);
    EXPECT_TRUE(saw_stop);
}
