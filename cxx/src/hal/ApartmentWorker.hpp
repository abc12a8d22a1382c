/**
 * @file ApartmentWorker.hpp
 * @brief Dedicated thread that owns a threading apartment and runs jobs on it.
 */

#ifndef HAL_APARTMENT_WORKER_HPP
#define HAL_APARTMENT_WORKER_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include "DriverError.hpp"

namespace hal {

/**
 * @brief Per-thread concurrency-model initialization (COM on Windows).
 *
 * enter_apartment() and the matching leave_apartment() are always called
 * on the same thread.
 */
class Apartment {
public:
    virtual ~Apartment() = default;
    virtual Status enter_apartment() = 0;
    virtual void leave_apartment() = 0;
};

/**
 * @brief Runs submitted jobs one at a time, in submission order, on a single
 * thread that stays inside the apartment for its whole life.
 *
 * submit() blocks until the job has run, so code on the calling side reads
 * as an ordinary synchronous call. Jobs report results through state they
 * capture; an exception escaping a job is rethrown from submit().
 */
class ApartmentWorker {
public:
    using Job = std::function<void()>;

    /**
     * @throws DriverException if the worker thread cannot enter the apartment.
     * No thread is left running in that case.
     */
    explicit ApartmentWorker(Apartment& apartment);

    /**
     * @brief Runs the jobs already queued, leaves the apartment and joins.
     */
    ~ApartmentWorker();

    ApartmentWorker(const ApartmentWorker&) = delete;
    ApartmentWorker& operator=(const ApartmentWorker&) = delete;

    /**
     * @brief Execute @p job on the worker thread and wait for it to finish.
     * @throws std::logic_error when called from the worker thread itself.
     */
    void submit(Job job);

    bool on_worker_thread() const;

    /**
     * @brief Jobs queued but not yet started.
     */
    size_t pending_jobs() const;

private:
    void thread_loop(std::promise<Status> ready);

    Apartment& apartment_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::packaged_task<void()>> jobs_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace hal

#endif // HAL_APARTMENT_WORKER_HPP
