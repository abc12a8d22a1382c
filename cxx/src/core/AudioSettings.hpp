/**
 * @file AudioSettings.hpp
 * @brief Thread-safe storage for hardware-negotiated audio settings.
 */

#ifndef AUDIO_AUDIO_SETTINGS_HPP
#define AUDIO_AUDIO_SETTINGS_HPP

#include <atomic>

namespace audio {

/**
 * @brief Holds the settings the output driver actually negotiated.
 *
 * Uses std::atomic to ensure thread-safety between the driver (writer)
 * and the mixing engine/UI (readers). block_size is the hardware buffer
 * capacity in frames, the largest block a single fill cycle can request.
 */
struct AudioSettings {
    std::atomic<int> sample_rate{48000};
    std::atomic<int> block_size{0};
    std::atomic<int> num_channels{2};

    // Shared singleton instance for the process
    static AudioSettings& instance() {
        static AudioSettings inst;
        return inst;
    }
};

} // namespace audio

#endif // AUDIO_AUDIO_SETTINGS_HPP
