/**
 * test_config.cpp - Config parsing and validation
 */

#include "vox/Config.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using vox::Config;
using vox::ConfigError;

namespace {

bool rejects(const json& root) {
    try {
        Config::fromJson(root);
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

} // anonymous namespace

void test_defaults() {
    Config config = Config::fromJson(json::object());

    assert(config.queue.max_size == 50);
    assert(config.pipeline.stale_after_ms == 0);
    assert(config.supervisor.backoff_ms == 3000);
    assert(config.command_server.enabled);
    assert(!config.voice.enabled);
    assert(config.queue.admin_ids.empty());

    std::cout << "[PASS] test_defaults" << std::endl;
}

void test_overrides() {
    Config config = Config::fromJson(json::parse(R"({
        "queue": {"max_size": 5, "admin_ids": ["boss", "mod"]},
        "pipeline": {"stale_after_ms": 60000},
        "supervisor": {"backoff_ms": 1500},
        "policy": {"blocked_keywords": ["spoiler"]},
        "avatar": {"enabled": true, "fps": 60},
        "live_chat": {"enabled": true, "question_markers": ["q:"]}
    })"));

    assert(config.queue.max_size == 5);
    assert(config.queue.admin_ids.size() == 2 && config.queue.admin_ids[1] == "mod");
    assert(config.pipeline.stale_after_ms == 60000);
    assert(config.supervisor.backoff_ms == 1500);
    assert(config.policy.blocked_keywords.size() == 1);
    assert(config.avatar.enabled && config.avatar.fps == 60);
    assert(config.live_chat.question_markers[0] == "q:");
    assert(config.llm.url == "http://localhost:8080");

    std::cout << "[PASS] test_overrides" << std::endl;
}

void test_invalid_values() {
    assert(rejects(json::array()));
    assert(rejects(json::parse(R"({"queue": {"max_size": 0}})")));
    assert(rejects(json::parse(R"({"queue": {"max_size": "ten"}})")));
    assert(rejects(json::parse(R"({"queue": []})")));
    assert(rejects(json::parse(R"({"supervisor": {"backoff_ms": 0}})")));
    assert(rejects(json::parse(R"({"pipeline": {"stale_after_ms": -1}})")));
    assert(rejects(json::parse(R"({"avatar": {"fps": 0}})")));
    assert(rejects(json::parse(R"({"voice": {"vad_mode": 4}})")));
    assert(rejects(json::parse(R"({"command_server": {"port": 70000}})")));
    assert(rejects(json::parse(R"({"command_server": {"enabled": false}})")));
    assert(rejects(json::parse(R"({"llm": {"timeout_ms": -5}})")));
    assert(rejects(json::parse(R"({"tts": {"timeout_ms": 0}})")));
    assert(rejects(json::parse(R"({"avatar": {"timeout_ms": -1}})")));
    assert(rejects(json::parse(R"({"live_chat": {"timeout_ms": 0}})")));
    assert(!rejects(json::parse(R"({"llm": {"timeout_ms": 1}})")));

    std::cout << "[PASS] test_invalid_values" << std::endl;
}

void test_load_file() {
    const char* path = "vox_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"queue": {"max_size": 7}})";
    }
    Config config = Config::loadFile(path);
    assert(config.queue.max_size == 7);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool threw = false;
    try {
        Config::loadFile(path);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::remove(path);

    threw = false;
    try {
        Config::loadFile("does/not/exist.json");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] test_load_file" << std::endl;
}

int main() {
    std::cout << "=== Config Tests ===" << std::endl;

    test_defaults();
    test_overrides();
    test_invalid_values();
    test_load_file();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
