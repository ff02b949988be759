#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace audio {

/**
 * @brief Metadata about a speech synthesis engine
 */
struct SpeechEngineInfo {
    std::string id;                      // Unique engine identifier ("synthetic", ...)
    std::string name;                    // Human-readable name
    std::string driver;                  // Backend name ("Synthetic", "AVSpeech", "SAPI")
    double base_characters_per_second;   // Speaking rate at rate 1.0
    bool is_default;

    SpeechEngineInfo()
        : base_characters_per_second(14.0)
        , is_default(false) {}
};

/**
 * @brief Configuration for a speech engine
 */
struct SpeechEngineConfig {
    std::string engine_id;               // Engine to use (empty = default)

    // For synthetic engine only
    double base_characters_per_second = 14.0;   // Simulated speaking rate at rate 1.0
    double time_scale = 1.0;                    // Wall-clock multiplier (0.01 = 100x faster)
    bool echo_text = false;                     // Log each utterance as it is "spoken"
};

/**
 * @brief Voice parameters for one utterance
 */
struct VoiceParams {
    std::string voice_id;                // Engine voice (empty = engine default)
    float rate = 1.0f;                   // 1.0 = normal speaking rate
    float pitch = 1.0f;
    float volume = 1.0f;                 // 0.0 - 1.0
    double pre_delay_s = 0.0;            // Silence before speaking
    double post_delay_s = 0.0;           // Silence after speaking
};

/**
 * @brief One unit of speech handed to the engine
 */
struct SpeechRequest {
    uint64_t id = 0;                     // Echoed back in every callback for this request
    std::string text;
    VoiceParams voice;
};

/**
 * @brief Called when the engine begins speaking a request
 */
using StartedCallback = std::function<void(uint64_t request_id)>;

/**
 * @brief Called when a request finished naturally
 *
 * Not called for requests cancelled by stop() or replaced by speak().
 *
 * @param request_id Id from the SpeechRequest
 * @param actual_duration_s Speaking time in seconds, excluding pauses
 */
using FinishedCallback = std::function<void(uint64_t request_id, double actual_duration_s)>;

/**
 * @brief Error callback for synthesis failures
 *
 * @param request_id Request that failed (0 if not tied to one)
 * @param error_message Human-readable error description
 * @param is_fatal If true, the engine needs re-initialization
 */
using SpeechErrorCallback = std::function<void(uint64_t request_id, const std::string& error_message, bool is_fatal)>;

struct SpeechEngineCallbacks {
    StartedCallback on_started;
    FinishedCallback on_finished;
    SpeechErrorCallback on_error;
};

/**
 * @brief Abstract base class for speech synthesis engines
 *
 * Implementations:
 * - SpeechEngine_Synthetic (timed simulation, used for demos and tests)
 *
 * Callbacks may arrive on an engine-owned thread.
 */
class ISpeechEngine {
public:
    virtual ~ISpeechEngine() = default;

    /**
     * @brief Initialize the engine with configuration
     * @param config Engine configuration
     * @param callbacks Lifecycle and error notifications
     * @return true if initialization succeeded
     */
    virtual bool initialize(const SpeechEngineConfig& config, SpeechEngineCallbacks callbacks) = 0;

    /**
     * @brief Start speaking a request, replacing anything currently spoken
     * @return false if the request was rejected (nothing will be reported for it)
     */
    virtual bool speak(const SpeechRequest& request) = 0;

    /**
     * @brief Pause the current request where it is
     * @return true if something was paused
     */
    virtual bool pause() = 0;

    /**
     * @brief Continue a paused request
     * @return true if something was resumed
     */
    virtual bool resume() = 0;

    /**
     * @brief Cancel the current request without a completion report
     */
    virtual void stop() = 0;

    /**
     * @brief Change the volume of the request being spoken
     */
    virtual void set_volume(float volume) = 0;

    /**
     * @brief Check if a request is in progress (including paused)
     */
    virtual bool is_speaking() const = 0;

    /**
     * @brief Get engine information
     */
    virtual SpeechEngineInfo get_engine_info() const = 0;
};

/**
 * @brief Factory for creating speech engines
 */
class SpeechEngineFactory {
public:
    /**
     * @brief Enumerate all available speech engines
     * @return List of engines (always includes synthetic)
     */
    static std::vector<SpeechEngineInfo> enumerate_engines();

    /**
     * @brief Create a speech engine
     * @param engine_id Engine ID from SpeechEngineInfo, or empty for default
     * @return Engine instance, or nullptr for unknown ids
     */
    static std::unique_ptr<ISpeechEngine> create_engine(const std::string& engine_id = "");

    /**
     * @brief Get the default engine ID
     */
    static std::string get_default_engine_id();

    /**
     * @brief Check if an engine ID is valid
     */
    static bool is_engine_available(const std::string& engine_id);
};

} // namespace audio
