#pragma once

#include "crc32c.hpp"
#include <cstdint>
#include <string>

namespace tw {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern;     // empty keeps the spdlog default
};

struct CrcConfig {
    CrcEngine engine = CrcEngine::Auto;
};

enum class MetricsFormat : uint8_t { None, Json, Prometheus };

struct InspectConfig {
    uint64_t max_frames = 0;   // 0 = no limit
    bool stop_on_error = false;
    bool decode_messages = true;
    MetricsFormat metrics_format = MetricsFormat::None;
};

struct Config {
    LoggingConfig logging;
    CrcConfig crc;
    InspectConfig inspect;

    static Config load_from_file(const std::string& path);
    static Config parse(const std::string& json_text);
    static Config default_config();
};

// Sets spdlog's global level and pattern; unknown levels fall back to info.
void apply_logging(const LoggingConfig& logging);

} // namespace tw
