/**
 * test_lifecycle.cpp - Startup and ordered shutdown
 */

#include "vox/core/LifecycleCoordinator.hpp"
#include "../fakes/FakeCollaborators.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace vox;
using namespace vox::core;
using namespace vox::testing;

namespace {

Config makeConfig() {
    Config config;
    config.queue.max_size = 10;
    config.supervisor.backoff_ms = 50;
    config.avatar.fps = 50;
    return config;
}

struct Rig {
    Config config = makeConfig();
    FakeGenerator generator;
    FakeSynthesizer synthesizer;
    FakePlayback playback;
    FakeAvatar avatar;
    QueueManager queue{config.queue};
    std::unique_ptr<ResponsePipeline> pipeline;

    Rig() {
        PipelineDependencies deps;
        deps.generator = &generator;
        deps.synthesizer = &synthesizer;
        deps.playback = &playback;
        deps.avatar = &avatar;
        pipeline = std::make_unique<ResponsePipeline>(queue, deps, config.pipeline);
    }
};

} // anonymous namespace

void test_start_spawns_and_connects() {
    Rig rig;
    FakeAdapter chat("chat");
    FakeAdapter flaky("flaky", FakeAdapter::Mode::Drop);

    LifecycleCoordinator lifecycle(rig.queue, *rig.pipeline, &rig.avatar, rig.config);
    lifecycle.addAdapter(chat);
    lifecycle.addAdapter(flaky);
    lifecycle.start();
    lifecycle.start();

    assert(lifecycle.started());
    assert(lifecycle.avatarConnected());
    assert(rig.avatar.connects == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    assert(rig.avatar.ticks > 0);

    auto states = lifecycle.connectionStates();
    assert(states.size() == 2);
    assert(states[0].adapter == "chat");
    assert(states[1].adapter == "flaky");
    assert(states[1].retry_count >= 1);

    rig.queue.enqueue(makeItem("alice", "hello"));
    for (int i = 0; i < 100 && rig.pipeline->stats().processed == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(rig.pipeline->stats().processed == 1);

    lifecycle.shutdown();
    assert(chat.stops == 1);
    assert(flaky.stops == 1);
    assert(rig.avatar.disconnects == 1);
    assert(rig.queue.stopped());

    std::cout << "[PASS] test_start_spawns_and_connects" << std::endl;
}

void test_unreachable_avatar_is_optional() {
    Rig rig;
    rig.avatar.reachable = false;

    LifecycleCoordinator lifecycle(rig.queue, *rig.pipeline, &rig.avatar, rig.config);
    lifecycle.start();
    assert(!lifecycle.avatarConnected());

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    assert(rig.avatar.ticks == 0);

    lifecycle.shutdown();
    assert(rig.avatar.disconnects == 0);

    std::cout << "[PASS] test_unreachable_avatar_is_optional" << std::endl;
}

void test_shutdown_lets_playing_item_finish() {
    Rig rig;
    rig.playback.hold = true;
    FakeAdapter chat("chat");

    LifecycleCoordinator lifecycle(rig.queue, *rig.pipeline, &rig.avatar, rig.config);
    lifecycle.addAdapter(chat);
    lifecycle.start();

    rig.queue.enqueue(makeItem("alice", "long answer please"));
    rig.queue.enqueue(makeItem("bob", "never reached"));
    assert(rig.playback.waitUntilPlaying(std::chrono::seconds(2)));

    std::atomic<bool> shutdown_returned{false};
    std::thread stopper([&]() {
        lifecycle.shutdown();
        shutdown_returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!shutdown_returned);
    assert(lifecycle.stopping());
    assert(rig.queue.stopped());
    assert(chat.stops == 1);

    rig.playback.release();
    stopper.join();

    assert(shutdown_returned);
    assert(rig.playback.finished == 1);
    assert(rig.pipeline->stats().processed == 1);
    assert(rig.generator.seen.size() == 1);

    // Talking was reset after playback even though shutdown was under way
    std::vector<bool> talking = rig.avatar.talkingCalls();
    assert(!talking.empty() && talking.back() == false);

    std::cout << "[PASS] test_shutdown_lets_playing_item_finish" << std::endl;
}

void test_shutdown_is_idempotent() {
    Rig rig;
    FakeAdapter chat("chat");

    {
        LifecycleCoordinator lifecycle(rig.queue, *rig.pipeline, &rig.avatar, rig.config);
        lifecycle.addAdapter(chat);
        lifecycle.start();

        lifecycle.shutdown();
        lifecycle.shutdown();
        lifecycle.start();
        assert(lifecycle.stopSignal().requested());
    }

    assert(chat.stops == 1);
    assert(rig.avatar.disconnects == 1);

    std::cout << "[PASS] test_shutdown_is_idempotent" << std::endl;
}

void test_request_stop_wakes_waiter() {
    Rig rig;
    LifecycleCoordinator lifecycle(rig.queue, *rig.pipeline, nullptr, rig.config);
    lifecycle.start();

    std::thread waiter([&]() { lifecycle.waitForStop(); });
    lifecycle.requestStop();
    waiter.join();

    lifecycle.shutdown();
    assert(rig.queue.stopped());

    std::cout << "[PASS] test_request_stop_wakes_waiter" << std::endl;
}

int main() {
    std::cout << "=== LifecycleCoordinator Tests ===" << std::endl;

    test_start_spawns_and_connects();
    test_unreachable_avatar_is_optional();
    test_shutdown_lets_playing_item_finish();
    test_shutdown_is_idempotent();
    test_request_stop_wakes_waiter();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
