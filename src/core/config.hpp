#pragma once
#include <string>
#include "core/logging.hpp"

namespace core {
struct Config {
    LogLevel log_level = LogLevel::Info;
    std::string speech_engine = "synthetic";
    double engine_time_scale = 1.0;   // <1.0 runs the synthetic engine faster than real time
    bool echo_utterances = true;      // synthetic engine prints what it "speaks"
};

// Process-wide settings, seeded once from TALK_READER_LOG_LEVEL / TALK_READER_ENGINE.
const Config& get_config();

// Overrides from the command line. Applies the log level immediately.
void set_config(const Config& config);
}
