/**
 * @file ScratchBuffer.hpp
 * @brief Reusable interleaved sample buffer that only ever grows.
 */

#ifndef HAL_SCRATCH_BUFFER_HPP
#define HAL_SCRATCH_BUFFER_HPP

#include <cstddef>
#include <span>
#include <vector>

namespace hal {

/**
 * @brief Tracks allocated capacity separately from logical length.
 *
 * Allocation happens only when a request exceeds every earlier one, so a
 * steady stream of fill cycles never touches the heap.
 */
class ScratchBuffer {
public:
    /**
     * @brief Set the logical length, growing storage if needed.
     * @return View of the first @p samples samples.
     */
    std::span<float> resize(size_t samples) {
        if (storage_.size() < samples) {
            storage_.resize(samples, 0.0f);
        }
        size_ = samples;
        return std::span<float>(storage_.data(), size_);
    }

    // Keeps the allocation.
    void clear() { size_ = 0; }

    std::span<float> samples() { return std::span<float>(storage_.data(), size_); }
    size_t size() const { return size_; }
    size_t capacity() const { return storage_.size(); }

private:
    std::vector<float> storage_;
    size_t size_ = 0;
};

} // namespace hal

#endif // HAL_SCRATCH_BUFFER_HPP
