#include <gtest/gtest.h>
#include "ApartmentWorker.hpp"
#include "FakePlatform.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace hal;

TEST(ApartmentWorkerTest, RunsJobsOnItsApartmentThread) {
    test::FakeApartment apartment;
    std::thread::id job_thread;
    {
        ApartmentWorker worker(apartment);
        worker.submit([&] { job_thread = std::this_thread::get_id(); });
        EXPECT_FALSE(worker.on_worker_thread());
    }

    ASSERT_EQ(apartment.entered_threads.size(), 1u);
    ASSERT_EQ(apartment.left_threads.size(), 1u);
    EXPECT_EQ(apartment.entered_threads[0], job_thread);
    EXPECT_EQ(apartment.left_threads[0], job_thread);
    EXPECT_NE(job_thread, std::this_thread::get_id());
}

TEST(ApartmentWorkerTest, SubmitBlocksUntilJobCompletes) {
    test::FakeApartment apartment;
    ApartmentWorker worker(apartment);

    bool done = false;
    worker.submit([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        done = true;
    });
    EXPECT_TRUE(done);
}

TEST(ApartmentWorkerTest, ResultTravelsThroughCapturedSlot) {
    test::FakeApartment apartment;
    ApartmentWorker worker(apartment);

    Status result;
    worker.submit([&] { result = make_error(error_code::kUnexpected, "job failed"); });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->code, error_code::kUnexpected);
}

TEST(ApartmentWorkerTest, ApartmentFailureFailsConstruction) {
    test::FakeApartment apartment;
    apartment.fail_enter_at = 1;

    try {
        ApartmentWorker worker(apartment);
        FAIL() << "construction should have thrown";
    } catch (const DriverException& e) {
        EXPECT_EQ(e.error().code, error_code::kUnexpected);
    }
    EXPECT_TRUE(apartment.entered_threads.empty());
    EXPECT_TRUE(apartment.left_threads.empty());
}

TEST(ApartmentWorkerTest, JobExceptionReachesSubmitterAndWorkerSurvives) {
    test::FakeApartment apartment;
    ApartmentWorker worker(apartment);

    EXPECT_THROW(worker.submit([] { throw std::runtime_error("boom"); }), std::runtime_error);

    int value = 0;
    worker.submit([&] { value = 7; });
    EXPECT_EQ(value, 7);
}

TEST(ApartmentWorkerTest, SubmitFromWorkerThreadIsRejected) {
    test::FakeApartment apartment;
    ApartmentWorker worker(apartment);

    bool rejected = false;
    worker.submit([&] {
        try {
            worker.submit([] {});
        } catch (const std::logic_error&) {
            rejected = true;
        }
    });
    EXPECT_TRUE(rejected);
}

TEST(ApartmentWorkerTest, FifoOrderAcrossConcurrentSubmitters) {
    test::FakeApartment apartment;
    ApartmentWorker worker(apartment);

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool gate_open = false;
    std::atomic<bool> blocker_running{false};

    // Hold the worker busy so the following jobs queue up behind it.
    std::thread blocker([&] {
        worker.submit([&] {
            blocker_running = true;
            std::unique_lock<std::mutex> lock(gate_mutex);
            gate_cv.wait(lock, [&] { return gate_open; });
        });
    });
    EXPECT_TRUE(test::wait_until([&] { return blocker_running.load(); }));

    constexpr int kSubmitters = 8;
    std::mutex log_mutex;
    std::vector<int> log;
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    std::vector<std::thread> submitters;
    for (int id = 0; id < kSubmitters; ++id) {
        submitters.emplace_back([&, id] {
            worker.submit([&, id] {
                int now = ++in_flight;
                int seen = max_in_flight.load();
                while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}
                {
                    std::lock_guard<std::mutex> lock(log_mutex);
                    log.push_back(id);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                --in_flight;
            });
        });
        // Submission order is the order jobs reach the queue.
        EXPECT_TRUE(test::wait_until([&] { return worker.pending_jobs() == static_cast<size_t>(id + 1); }));
    }

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        gate_open = true;
    }
    gate_cv.notify_all();

    blocker.join();
    for (auto& t : submitters) t.join();

    ASSERT_EQ(log.size(), static_cast<size_t>(kSubmitters));
    for (int i = 0; i < kSubmitters; ++i) {
        EXPECT_EQ(log[i], i);
    }
    EXPECT_EQ(max_in_flight.load(), 1);
}

TEST(ApartmentWorkerTest, ManySubmittersNeverOverlap) {
    test::FakeApartment apartment;
    ApartmentWorker worker(apartment);

    std::atomic<int> in_flight{0};
    std::atomic<int> overlaps{0};
    std::atomic<int> executed{0};

    std::vector<std::thread> submitters;
    for (int t = 0; t < 4; ++t) {
        submitters.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                worker.submit([&] {
                    if (++in_flight > 1) overlaps++;
                    executed++;
                    --in_flight;
                });
            }
        });
    }
    for (auto& t : submitters) t.join();

    EXPECT_EQ(executed.load(), 200);
    EXPECT_EQ(overlaps.load(), 0);
}
