#include "speech_engine.hpp"
#include "speech_engine_synthetic.hpp"

namespace audio {

std::vector<SpeechEngineInfo> SpeechEngineFactory::enumerate_engines() {
    std::vector<SpeechEngineInfo> engines;

    // Platform voices plug in here; the synthetic engine is always present
    SpeechEngineInfo synthetic;
    synthetic.id = "synthetic";
    synthetic.name = "Synthetic Speech (timed simulation)";
    synthetic.driver = "Synthetic";
    synthetic.base_characters_per_second = 14.0;
    synthetic.is_default = true;
    engines.push_back(synthetic);

    return engines;
}

std::unique_ptr<ISpeechEngine> SpeechEngineFactory::create_engine(const std::string& engine_id) {
    if (engine_id.empty() || engine_id == "default" || engine_id == "synthetic") {
        return std::make_unique<SpeechEngine_Synthetic>();
    }
    return nullptr;
}

std::string SpeechEngineFactory::get_default_engine_id() {
    for (const auto& engine : enumerate_engines()) {
        if (engine.is_default) {
            return engine.id;
        }
    }
    return "";
}

bool SpeechEngineFactory::is_engine_available(const std::string& engine_id) {
    auto engines = enumerate_engines();
    for (const auto& engine : engines) {
        if (engine.id == engine_id) {
            return true;
        }
    }
    return false;
}

} // namespace audio
