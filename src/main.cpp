/**
 * VoxStage - Main Entry Point
 *
 * Voice-reply host: takes questions from the microphone, a local HTTP
 * endpoint and live chat, and answers them one at a time out loud.
 */

#include "vox/Config.hpp"
#include "vox/Orchestrator.hpp"
#include "vox/audio/MicrophoneCapture.hpp"
#include "vox/audio/PortAudioPlayback.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

const char* kDefaultConfig = "config/voxstage.json";

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>   config file (default " << kDefaultConfig << ")\n"
              << "  --list-devices    print audio devices and exit\n"
              << "  --help            show this message\n";
}

void listDevices() {
    std::cout << "Input devices:" << std::endl;
    for (const auto& name : vox::audio::MicrophoneCapture::listInputDevices()) {
        std::cout << "  " << name << std::endl;
    }
    std::cout << "Output devices:" << std::endl;
    for (const auto& name : vox::audio::PortAudioPlayback::listOutputDevices()) {
        std::cout << "  " << name << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path = kDefaultConfig;
    bool explicit_config = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            explicit_config = true;
        } else if (std::strcmp(argv[i], "--list-devices") == 0) {
            listDevices();
            return 0;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║                 VOXSTAGE v0.1.0               ║
    ║      one question at a time, out loud         ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    vox::Config config;
    try {
        if (explicit_config || std::ifstream(config_path).good()) {
            config = vox::Config::loadFile(config_path);
            std::cout << "[VoxStage] Config: " << config_path << std::endl;
        } else {
            config.validate();
            std::cout << "[VoxStage] No config file, using defaults" << std::endl;
        }
    } catch (const vox::ConfigError& e) {
        std::cerr << "[VoxStage] Config error: " << e.what() << std::endl;
        return 1;
    }

    vox::Orchestrator orchestrator(config);
    orchestrator.start();

    auto last_status = std::chrono::steady_clock::now();
    while (g_running && !orchestrator.stopRequested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - last_status >= std::chrono::seconds(30)) {
            std::cout << "[VoxStage] " << orchestrator.statusLine() << std::endl;
            last_status = now;
        }
    }

    std::cout << "\n[VoxStage] Shutting down..." << std::endl;
    orchestrator.stop();

    std::cout << "[VoxStage] Goodbye!" << std::endl;
    return 0;
}
