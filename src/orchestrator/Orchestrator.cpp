/**
 * Orchestrator.cpp - Wires adapters, queue, pipeline and collaborators
 *
 * Adapters (voice, command server, live chat) → QueueManager →
 * ResponsePipeline (LLM → TTS → post-process → playback + avatar)
 */

#include "vox/Orchestrator.hpp"
#include "vox/AdminCommands.hpp"
#include "vox/adapters/CommandServer.hpp"
#include "vox/adapters/LiveChatPoller.hpp"
#include "vox/adapters/VoiceListener.hpp"
#include "vox/audio/PortAudioPlayback.hpp"
#include "vox/avatar/AvatarBridge.hpp"
#include "vox/core/LifecycleCoordinator.hpp"
#include "vox/core/QueueManager.hpp"
#include "vox/core/ResponsePipeline.hpp"
#include "vox/llm/ConversationEngine.hpp"
#include "vox/llm/PolicyGuard.hpp"
#include "vox/tts/TTSEngine.hpp"

#include <iostream>
#include <sstream>

namespace vox {

struct Orchestrator::Impl {
    Config config;

    // Declaration order is destruction order in reverse: the coordinator
    // goes first so every task is joined before anything it uses is freed.
    std::unique_ptr<core::QueueManager> queue;
    std::unique_ptr<audio::PortAudioPlayback> playback;
    std::unique_ptr<tts::TTSEngine> tts;
    std::unique_ptr<llm::ConversationEngine> llm;
    std::unique_ptr<avatar::AvatarBridge> avatar;
    std::unique_ptr<AdminCommands> admin;
    std::unique_ptr<adapters::CommandServer> command_server;
    std::unique_ptr<adapters::VoiceListener> voice;
    std::unique_ptr<adapters::LiveChatPoller> live_chat;
    std::unique_ptr<core::ResponsePipeline> pipeline;
    std::unique_ptr<core::LifecycleCoordinator> coordinator;

    explicit Impl(const Config& cfg) : config(cfg) {}

    void build();
};

void Orchestrator::Impl::build() {
    std::cout << "[Orchestrator] Building components..." << std::endl;

    queue = std::make_unique<core::QueueManager>(config.queue);
    std::cout << "[Orchestrator] Queue OK (capacity " << queue->capacity() << ")" << std::endl;

    playback = std::make_unique<audio::PortAudioPlayback>(config.playback);
    if (playback->initialize()) {
        std::cout << "[Orchestrator] Playback OK" << std::endl;
    } else {
        std::cerr << "[Orchestrator] WARNING: playback unavailable (" << playback->lastError()
                  << "), replies will be aborted" << std::endl;
        playback.reset();
    }

    tts = std::make_unique<tts::TTSEngine>(config.tts);
    if (tts->isReady()) {
        std::cout << "[Orchestrator] TTS OK" << std::endl;
    } else {
        std::cerr << "[Orchestrator] WARNING: TTS server not reachable at " << config.tts.url
                  << " (" << tts->lastError() << ")" << std::endl;
    }

    llm = std::make_unique<llm::ConversationEngine>(config.llm, llm::PolicyGuard(config.policy.blocked_keywords));
    if (llm->isReady()) {
        std::cout << "[Orchestrator] LLM OK" << std::endl;
    } else {
        std::cerr << "[Orchestrator] WARNING: LLM server not reachable at " << config.llm.url << std::endl;
    }

    if (config.avatar.enabled) {
        avatar = std::make_unique<avatar::AvatarBridge>(config.avatar);
    }

    admin = std::make_unique<AdminCommands>(*queue);

    if (config.command_server.enabled) {
        command_server = std::make_unique<adapters::CommandServer>(*queue, *admin, config.command_server);
    }

    core::PipelineDependencies deps;
    deps.generator = llm.get();
    deps.synthesizer = tts.get();
    deps.playback = playback.get();
    deps.avatar = avatar.get();
    if (command_server) {
        deps.feedback[core::Source::Text] = command_server.get();
    }

    core::PipelineCallbacks callbacks;
    callbacks.onItemFinished = [](const core::QueueItem& item, core::Stage stage, const std::string& reason) {
        if (stage == core::Stage::Aborted) {
            std::cerr << "[Orchestrator] Item #" << item.sequence << " from " << item.user_name
                      << " aborted: " << reason << std::endl;
        }
    };

    pipeline = std::make_unique<core::ResponsePipeline>(*queue, deps, config.pipeline, callbacks);
    admin->setPipeline(pipeline.get());
    if (command_server) {
        command_server->setPipeline(pipeline.get());
    }

    coordinator = std::make_unique<core::LifecycleCoordinator>(*queue, *pipeline, avatar.get(), config);
    core::LifecycleCoordinator* lifecycle = coordinator.get();
    admin->setConnectionProvider([lifecycle]() { return lifecycle->connectionStates(); });

    if (command_server) {
        coordinator->addAdapter(*command_server);
        std::cout << "[Orchestrator] Command server on " << config.command_server.host << ":"
                  << config.command_server.port << std::endl;
    }
    if (config.voice.enabled) {
        voice = std::make_unique<adapters::VoiceListener>(*queue, config.voice);
        coordinator->addAdapter(*voice);
        std::cout << "[Orchestrator] Voice input enabled (" << config.voice.whisper_model << ")" << std::endl;
    }
    if (config.live_chat.enabled) {
        live_chat = std::make_unique<adapters::LiveChatPoller>(*queue, config.live_chat);
        coordinator->addAdapter(*live_chat);
        std::cout << "[Orchestrator] Live chat enabled (" << config.live_chat.url << config.live_chat.path << ")"
                  << std::endl;
    }
}

Orchestrator::Orchestrator(const Config& config)
    : impl_(std::make_unique<Impl>(config))
{
    impl_->build();
}

Orchestrator::~Orchestrator() {
    if (impl_ && impl_->coordinator) {
        impl_->coordinator->shutdown();
    }
}

void Orchestrator::start() {
    impl_->coordinator->start();
    std::cout << "[Orchestrator] Running" << std::endl;
}

void Orchestrator::stop() {
    impl_->coordinator->shutdown();
}

bool Orchestrator::stopRequested() const {
    return impl_->coordinator->stopSignal().requested();
}

std::string Orchestrator::statusLine() const {
    core::QueueStats q = impl_->queue->stats();
    core::PipelineStats p = impl_->pipeline->stats();

    std::ostringstream line;
    line << "queue " << q.size << "/" << q.capacity
         << (q.paused ? " (paused)" : "")
         << ", processed " << p.processed
         << ", aborted " << p.aborted
         << ", suppressed " << p.suppressed;
    if (auto current = impl_->pipeline->current()) {
        line << ", now " << core::toString(current->stage) << " for " << current->user_name;
    }
    return line.str();
}

} // namespace vox
