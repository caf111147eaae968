/**
 * Config.hpp - Runtime configuration loaded once at startup
 *
 * Every section maps to one JSON object in the config file. Missing keys
 * keep their defaults; bad values raise ConfigError, which aborts startup.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace vox {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct QueueConfig {
    int max_size = 50;
    std::vector<std::string> admin_ids;
};

struct PipelineConfig {
    int stale_after_ms = 0;  // 0 disables staleness checks
};

struct SupervisorConfig {
    int backoff_ms = 3000;
};

struct LLMConfig {
    std::string url = "http://localhost:8080";
    int timeout_ms = 60000;
    int max_tokens = 256;
    float temperature = 0.7f;
    std::string system_prompt;  // empty = built-in persona
};

struct PolicyConfig {
    std::vector<std::string> blocked_keywords;
};

struct TTSConfig {
    std::string url = "http://localhost:5050";
    int timeout_ms = 60000;
};

struct AvatarConfig {
    bool enabled = false;
    std::string url = "http://localhost:8001";
    int fps = 30;
    int timeout_ms = 2000;
};

struct PlaybackConfig {
    int device = -1;  // -1 = default output
    int frames_per_buffer = 512;
};

struct VoiceConfig {
    bool enabled = false;
    std::string whisper_model = "models/whisper/ggml-small-q5_1.bin";
    std::string language = "en";
    int threads = 4;
    int vad_mode = 2;
    int device = -1;
    int silence_timeout_ms = 500;
    int min_speech_ms = 300;
    std::string user_id = "local-mic";
    std::string user_name = "Microphone";
};

struct LiveChatConfig {
    bool enabled = false;
    std::string url = "http://localhost:9000";
    std::string path = "/chat";
    int poll_ms = 1000;
    int timeout_ms = 5000;
    std::vector<std::string> question_markers;
};

struct CommandServerConfig {
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 8090;
};

struct Config {
    QueueConfig queue;
    PipelineConfig pipeline;
    SupervisorConfig supervisor;
    LLMConfig llm;
    PolicyConfig policy;
    TTSConfig tts;
    AvatarConfig avatar;
    PlaybackConfig playback;
    VoiceConfig voice;
    LiveChatConfig live_chat;
    CommandServerConfig command_server;

    /// Parse and validate. Throws ConfigError.
    static Config fromJson(const nlohmann::json& root);

    /// Read a JSON file. Throws ConfigError if it cannot be read or parsed.
    static Config loadFile(const std::string& path);

    /// Throws ConfigError describing the first invalid value.
    void validate() const;
};

} // namespace vox
