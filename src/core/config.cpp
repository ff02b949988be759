#include "core/config.hpp"
#include <cstdlib>
#include <mutex>

namespace core {

namespace {
std::mutex g_config_mutex;

Config load_from_environment() {
    Config cfg;
    if (const char* level = std::getenv("TALK_READER_LOG_LEVEL")) {
        LogLevel parsed;
        if (parse_log_level(level, parsed)) {
            cfg.log_level = parsed;
        } else {
            log_warn(std::string("Ignoring unknown TALK_READER_LOG_LEVEL: ") + level);
        }
    }
    if (const char* engine = std::getenv("TALK_READER_ENGINE")) {
        if (*engine != '\0') cfg.speech_engine = engine;
    }
    set_log_level(cfg.log_level);
    return cfg;
}

Config& storage() {
    static Config cfg = load_from_environment();
    return cfg;
}
}

const Config& get_config() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return storage();
}

void set_config(const Config& config) {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    storage() = config;
    set_log_level(config.log_level);
}

} // namespace core
