#include "config.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tw {

namespace {

void read_json(const nlohmann::json& j, Config& config) {
    if (j.contains("logging")) {
        auto& log = j["logging"];
        if (log.contains("level")) config.logging.level = log["level"].get<std::string>();
        if (log.contains("pattern")) config.logging.pattern = log["pattern"].get<std::string>();
    }

    if (j.contains("crc")) {
        auto& crc = j["crc"];
        if (crc.contains("engine")) {
            std::string name = crc["engine"].get<std::string>();
            if (auto engine = parse_engine(name)) {
                config.crc.engine = *engine;
            } else {
                spdlog::warn("Unknown crc engine '{}', keeping '{}'", name, engine_name(config.crc.engine));
            }
        }
    }

    if (j.contains("inspect")) {
        auto& insp = j["inspect"];
        if (insp.contains("max_frames")) config.inspect.max_frames = insp["max_frames"];
        if (insp.contains("stop_on_error")) config.inspect.stop_on_error = insp["stop_on_error"];
        if (insp.contains("decode_messages")) config.inspect.decode_messages = insp["decode_messages"];
        if (insp.contains("metrics_format")) {
            std::string format = insp["metrics_format"].get<std::string>();
            if (format == "none") {
                config.inspect.metrics_format = MetricsFormat::None;
            } else if (format == "json") {
                config.inspect.metrics_format = MetricsFormat::Json;
            } else if (format == "prometheus") {
                config.inspect.metrics_format = MetricsFormat::Prometheus;
            } else {
                spdlog::warn("Unknown metrics format '{}', ignoring", format);
            }
        }
    }
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    Config config = default_config();

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::info("Config file {} not found, using defaults", path);
        return config;
    }

    try {
        nlohmann::json j;
        file >> j;
        read_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to load config {}: {}", path, e.what());
        return default_config();
    }

    return config;
}

Config Config::parse(const std::string& json_text) {
    Config config = default_config();
    try {
        read_json(nlohmann::json::parse(json_text), config);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse config: {}", e.what());
        return default_config();
    }
    return config;
}

Config Config::default_config() {
    return Config{};
}

void apply_logging(const LoggingConfig& logging) {
    auto level = spdlog::level::from_str(logging.level);
    if (level == spdlog::level::off && logging.level != "off") {
        spdlog::warn("Unknown log level '{}', using info", logging.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);

    if (!logging.pattern.empty()) {
        spdlog::set_pattern(logging.pattern);
    }
}

} // namespace tw
