/**
 * @file ErrorCell.hpp
 * @brief Lock-free, write-once slot for the first fatal error of a driver thread.
 */

#ifndef HAL_ERROR_CELL_HPP
#define HAL_ERROR_CELL_HPP

#include <atomic>
#include <memory>
#include <optional>
#include "DriverError.hpp"

namespace hal {

/**
 * @brief Holds the first error stored into it; later stores are discarded.
 *
 * Readers poll load() from any thread. The cell never returns to empty.
 */
class ErrorCell {
public:
    ErrorCell() = default;
    ~ErrorCell() { delete error_.load(std::memory_order_acquire); }

    ErrorCell(const ErrorCell&) = delete;
    ErrorCell& operator=(const ErrorCell&) = delete;

    /**
     * @return true if this call set the cell.
     */
    bool try_store(DriverError error) {
        auto fresh = std::make_unique<const DriverError>(std::move(error));
        const DriverError* expected = nullptr;
        if (error_.compare_exchange_strong(expected, fresh.get(),
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
            fresh.release();
            return true;
        }
        return false;
    }

    std::optional<DriverError> load() const {
        const DriverError* current = error_.load(std::memory_order_acquire);
        if (!current) return std::nullopt;
        return *current;
    }

private:
    std::atomic<const DriverError*> error_{nullptr};
};

} // namespace hal

#endif // HAL_ERROR_CELL_HPP
