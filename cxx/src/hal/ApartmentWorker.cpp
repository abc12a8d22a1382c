/**
 * @file ApartmentWorker.cpp
 * @brief Single-consumer job queue bound to an apartment thread.
 */

#include "ApartmentWorker.hpp"
#include <iostream>
#include <stdexcept>

namespace hal {

ApartmentWorker::ApartmentWorker(Apartment& apartment)
    : apartment_(apartment)
{
    std::promise<Status> ready;
    std::future<Status> entered = ready.get_future();
    thread_ = std::thread(&ApartmentWorker::thread_loop, this, std::move(ready));

    Status status = entered.get();
    if (status) {
        // The thread has already returned without entering its loop.
        thread_.join();
        std::cerr << "ApartmentWorker: " << status->message << std::endl;
        throw DriverException(*status);
    }
}

ApartmentWorker::~ApartmentWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ApartmentWorker::submit(Job job) {
    if (on_worker_thread()) {
        throw std::logic_error("ApartmentWorker::submit called from the worker thread");
    }

    std::packaged_task<void()> task(std::move(job));
    std::future<void> done = task.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::logic_error("ApartmentWorker::submit called during shutdown");
        }
        jobs_.push_back(std::move(task));
    }
    cv_.notify_one();

    done.get();
}

bool ApartmentWorker::on_worker_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

size_t ApartmentWorker::pending_jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void ApartmentWorker::thread_loop(std::promise<Status> ready) {
    if (Status status = apartment_.enter_apartment()) {
        ready.set_value(std::move(status));
        return;
    }
    ready.set_value(std::nullopt);

    for (;;) {
        std::packaged_task<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        // Exceptions are captured in the job's future.
        job();
    }

    apartment_.leave_apartment();
}

} // namespace hal
