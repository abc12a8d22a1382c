/**
 * @file DriverConfig.hpp
 * @brief Human-readable JSON configuration for the output driver.
 */

#ifndef DRIVER_CONFIG_HPP
#define DRIVER_CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "../hal/DriverError.hpp"

namespace audio {

using json = nlohmann::json;

/**
 * @brief Stream parameters requested from the output driver.
 *
 * tone_hz and duration_ms only drive the audible check tool.
 */
struct DriverConfig {
    int version = 1;
    int sample_rate = 48000;
    int channels = 2;
    float tone_hz = 440.0f;
    int duration_ms = 1000;

    // Missing keys keep their defaults
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(DriverConfig, version, sample_rate, channels, tone_hz, duration_ms)
};

/**
 * @brief Manages saving and loading of DriverConfig.
 */
class ConfigStore {
public:
    static bool save_to_file(const DriverConfig& config, const std::string& path);
    static bool load_from_file(DriverConfig& config, const std::string& path);

    /**
     * @brief Convert DriverConfig to JSON string.
     */
    static std::string serialize(const DriverConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Load DriverConfig from JSON string.
     */
    static bool deserialize(DriverConfig& config, const std::string& data);

    /**
     * @brief Check the stream parameters the driver would reject.
     */
    static hal::Status validate(const DriverConfig& config);
};

} // namespace audio

#endif // DRIVER_CONFIG_HPP
