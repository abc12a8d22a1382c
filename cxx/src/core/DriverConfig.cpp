#include "DriverConfig.hpp"
#include "../hal/wasapi/MixFormat.hpp"
#include <fstream>
#include <iostream>

namespace audio {

bool ConfigStore::deserialize(DriverConfig& config, const std::string& data) {
    try {
        json j = json::parse(data);
        config = j.get<DriverConfig>();
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] Invalid config: " << e.what() << std::endl;
        return false;
    }
}

hal::Status ConfigStore::validate(const DriverConfig& config) {
    hal::wasapi::MixFormat format;
    if (auto err = hal::wasapi::build_float_format(config.sample_rate, config.channels, format)) {
        return err;
    }
    if (config.duration_ms < 0) {
        return hal::make_error(hal::error_code::kInvalidArgument, "duration_ms must not be negative");
    }
    return std::nullopt;
}

bool ConfigStore::save_to_file(const DriverConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(DriverConfig& config, const std::string& path) {
    std::cout << "[ConfigStore] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    bool success = deserialize(config, content);
    if (success) {
        std::cout << "[ConfigStore] Loaded config: " << config.sample_rate << " Hz, "
                  << config.channels << " ch" << std::endl;
    } else {
        std::cerr << "[ConfigStore] Failed to deserialize config from: " << path << std::endl;
    }
    return success;
}

} // namespace audio
