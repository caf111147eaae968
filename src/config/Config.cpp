/**
 * Config.cpp - JSON configuration parsing and validation
 */

#include "vox/Config.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vox {

namespace {

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return *it;
}

template <typename T>
void read(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // anonymous namespace

Config Config::fromJson(const json& root) {
    if (!root.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    Config config;

    try {
        const json& queue = section(root, "queue");
        read(queue, "max_size", config.queue.max_size);
        read(queue, "admin_ids", config.queue.admin_ids);

        read(section(root, "pipeline"), "stale_after_ms", config.pipeline.stale_after_ms);
        read(section(root, "supervisor"), "backoff_ms", config.supervisor.backoff_ms);

        const json& llm = section(root, "llm");
        read(llm, "url", config.llm.url);
        read(llm, "timeout_ms", config.llm.timeout_ms);
        read(llm, "max_tokens", config.llm.max_tokens);
        read(llm, "temperature", config.llm.temperature);
        read(llm, "system_prompt", config.llm.system_prompt);

        read(section(root, "policy"), "blocked_keywords", config.policy.blocked_keywords);

        const json& tts = section(root, "tts");
        read(tts, "url", config.tts.url);
        read(tts, "timeout_ms", config.tts.timeout_ms);

        const json& avatar = section(root, "avatar");
        read(avatar, "enabled", config.avatar.enabled);
        read(avatar, "url", config.avatar.url);
        read(avatar, "fps", config.avatar.fps);
        read(avatar, "timeout_ms", config.avatar.timeout_ms);

        const json& playback = section(root, "playback");
        read(playback, "device", config.playback.device);
        read(playback, "frames_per_buffer", config.playback.frames_per_buffer);

        const json& voice = section(root, "voice");
        read(voice, "enabled", config.voice.enabled);
        read(voice, "whisper_model", config.voice.whisper_model);
        read(voice, "language", config.voice.language);
        read(voice, "threads", config.voice.threads);
        read(voice, "vad_mode", config.voice.vad_mode);
        read(voice, "device", config.voice.device);
        read(voice, "silence_timeout_ms", config.voice.silence_timeout_ms);
        read(voice, "min_speech_ms", config.voice.min_speech_ms);
        read(voice, "user_id", config.voice.user_id);
        read(voice, "user_name", config.voice.user_name);

        const json& chat = section(root, "live_chat");
        read(chat, "enabled", config.live_chat.enabled);
        read(chat, "url", config.live_chat.url);
        read(chat, "path", config.live_chat.path);
        read(chat, "poll_ms", config.live_chat.poll_ms);
        read(chat, "timeout_ms", config.live_chat.timeout_ms);
        read(chat, "question_markers", config.live_chat.question_markers);

        const json& server = section(root, "command_server");
        read(server, "enabled", config.command_server.enabled);
        read(server, "host", config.command_server.host);
        read(server, "port", config.command_server.port);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value type: ") + e.what());
    }

    config.validate();
    return config;
}

Config Config::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigError("cannot open config file: " + path);
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("malformed JSON in " + path + ": " + e.what());
    }

    std::cout << "[Config] Loaded " << path << std::endl;
    return fromJson(root);
}

void Config::validate() const {
    auto fail = [](const std::string& what) {
        throw ConfigError(what);
    };

    if (queue.max_size < 1) {
        fail("queue.max_size must be >= 1 (got " + std::to_string(queue.max_size) + ")");
    }
    if (pipeline.stale_after_ms < 0) {
        fail("pipeline.stale_after_ms must be >= 0");
    }
    if (supervisor.backoff_ms <= 0) {
        fail("supervisor.backoff_ms must be > 0 (got " + std::to_string(supervisor.backoff_ms) + ")");
    }
    if (avatar.fps < 1 || avatar.fps > 240) {
        fail("avatar.fps must be in 1..240");
    }
    if (playback.frames_per_buffer < 16) {
        fail("playback.frames_per_buffer must be >= 16");
    }
    if (voice.vad_mode < 0 || voice.vad_mode > 3) {
        fail("voice.vad_mode must be in 0..3");
    }
    if (voice.threads < 1) {
        fail("voice.threads must be >= 1");
    }
    if (live_chat.poll_ms <= 0) {
        fail("live_chat.poll_ms must be > 0");
    }
    if (command_server.port < 1 || command_server.port > 65535) {
        fail("command_server.port must be in 1..65535");
    }
    if (llm.timeout_ms <= 0) {
        fail("llm.timeout_ms must be > 0");
    }
    if (tts.timeout_ms <= 0) {
        fail("tts.timeout_ms must be > 0");
    }
    if (avatar.timeout_ms <= 0) {
        fail("avatar.timeout_ms must be > 0");
    }
    if (live_chat.timeout_ms <= 0) {
        fail("live_chat.timeout_ms must be > 0");
    }
    if (llm.max_tokens < 1) {
        fail("llm.max_tokens must be >= 1");
    }
    if (!voice.enabled && !live_chat.enabled && !command_server.enabled) {
        fail("no input enabled: turn on voice, live_chat or command_server");
    }
}

} // namespace vox
