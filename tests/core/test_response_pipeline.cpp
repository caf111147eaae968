/**
 * test_response_pipeline.cpp - Stage sequencing and failure isolation
 */

#include "vox/core/ResponsePipeline.hpp"
#include "../fakes/FakeCollaborators.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

using namespace vox;
using namespace vox::core;
using namespace vox::testing;

namespace {

QueueConfig queueConfig() {
    QueueConfig config;
    config.max_size = 10;
    config.admin_ids = {"boss"};
    return config;
}

struct Rig {
    FakeGenerator generator;
    FakeSynthesizer synthesizer;
    FakePlayback playback;
    FakeAvatar avatar;
    FakeFeedback feedback;
    QueueManager queue{queueConfig()};

    PipelineDependencies deps() {
        PipelineDependencies d;
        d.generator = &generator;
        d.synthesizer = &synthesizer;
        d.playback = &playback;
        d.avatar = &avatar;
        d.feedback[Source::Text] = &feedback;
        return d;
    }
};

} // anonymous namespace

void test_happy_path() {
    Rig rig;
    std::vector<Stage> stages;
    PipelineCallbacks callbacks;
    callbacks.onStageChange = [&](const QueueItem&, Stage stage) { stages.push_back(stage); };

    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{}, callbacks);
    StopSignal stop;

    Stage result = pipeline.process(makeItem("alice", "hello"), stop);
    assert(result == Stage::Done);

    std::vector<Stage> expected = {Stage::Generating, Stage::Synthesizing, Stage::PostProcessing,
                                   Stage::Playing, Stage::Done};
    assert(stages == expected);
    assert(rig.generator.seen.size() == 1 && rig.generator.seen[0] == "hello");
    assert(rig.playback.count() == 1);
    assert(rig.playback.last_rate == 16000);

    float peak = 0.0f;
    for (float s : rig.playback.buffers[0]) peak = std::max(peak, std::fabs(s));
    assert(std::fabs(peak - 0.95f) < 1e-4f);

    std::vector<bool> talking = {true, false};
    assert(rig.avatar.talkingCalls() == talking);
    assert(pipeline.stats().processed == 1);
    assert(!pipeline.busy());
    assert(!pipeline.current().has_value());

    std::cout << "[PASS] test_happy_path" << std::endl;
}

void test_synthesis_failure_skips_playback_and_moves_on() {
    Rig rig;
    rig.synthesizer.fail_on = {"broken"};
    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{});

    rig.queue.enqueue(makeItem("alice", "broken question"));
    rig.queue.enqueue(makeItem("bob", "fine question"));
    rig.queue.stop();

    StopSignal stop;
    auto started = std::chrono::steady_clock::now();
    pipeline.run(stop);
    auto elapsed = std::chrono::steady_clock::now() - started;

    assert(elapsed < std::chrono::seconds(1));
    assert(rig.synthesizer.calls == 2);
    assert(rig.playback.count() == 1);

    // Talking toggled only around bob's playback
    std::vector<bool> talking = {true, false};
    assert(rig.avatar.talkingCalls() == talking);

    PipelineStats stats = pipeline.stats();
    assert(stats.aborted == 1);
    assert(stats.processed == 1);

    assert(rig.feedback.messages.size() == 1);
    assert(rig.feedback.messages[0].find("alice: Sorry") == 0);

    std::cout << "[PASS] test_synthesis_failure_skips_playback_and_moves_on" << std::endl;
}

void test_generator_exception_aborts_only_that_item() {
    Rig rig;
    rig.generator.throw_next = true;
    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{});
    StopSignal stop;

    assert(pipeline.process(makeItem("alice", "first"), stop) == Stage::Aborted);
    assert(pipeline.process(makeItem("bob", "second"), stop) == Stage::Done);
    assert(rig.playback.count() == 1);
    assert(pipeline.stats().aborted == 1);

    std::cout << "[PASS] test_generator_exception_aborts_only_that_item" << std::endl;
}

void test_suppressed_reply_is_not_spoken() {
    Rig rig;
    rig.generator.suppress_containing = "secret";
    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{});
    StopSignal stop;

    assert(pipeline.process(makeItem("alice", "tell me the secret"), stop) == Stage::Done);
    assert(rig.synthesizer.calls == 0);
    assert(rig.playback.count() == 0);
    assert(rig.avatar.talkingCalls().empty());
    assert(pipeline.stats().suppressed == 1);
    assert(pipeline.stats().processed == 0);
    assert(rig.feedback.messages.size() == 1);
    assert(rig.feedback.messages[0].find("Skipped your message") != std::string::npos);

    std::cout << "[PASS] test_suppressed_reply_is_not_spoken" << std::endl;
}

void test_non_finite_audio_aborts() {
    Rig rig;
    rig.synthesizer.nan_output = true;
    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{});
    StopSignal stop;

    assert(pipeline.process(makeItem("alice", "hi"), stop) == Stage::Aborted);
    assert(rig.playback.count() == 0);
    assert(rig.avatar.talkingCalls().empty());

    std::cout << "[PASS] test_non_finite_audio_aborts" << std::endl;
}

void test_missing_playback_aborts() {
    Rig rig;
    PipelineDependencies deps = rig.deps();
    deps.playback = nullptr;
    ResponsePipeline pipeline(rig.queue, deps, PipelineConfig{});
    StopSignal stop;

    assert(pipeline.process(makeItem("alice", "hi"), stop) == Stage::Aborted);
    assert(rig.avatar.talkingCalls().empty());

    std::cout << "[PASS] test_missing_playback_aborts" << std::endl;
}

void test_playback_failure_still_stops_talking() {
    Rig rig;
    rig.playback.fail = true;
    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{});
    StopSignal stop;

    assert(pipeline.process(makeItem("alice", "hi"), stop) == Stage::Aborted);
    assert(rig.playback.count() == 1);
    std::vector<bool> talking = {true, false};
    assert(rig.avatar.talkingCalls() == talking);
    assert(rig.feedback.messages.size() == 1);
    assert(rig.feedback.messages[0].find("device unplugged") != std::string::npos);

    std::cout << "[PASS] test_playback_failure_still_stops_talking" << std::endl;
}

void test_playback_exception_still_stops_talking() {
    Rig rig;
    rig.playback.throw_on_play = true;
    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{});
    StopSignal stop;

    assert(pipeline.process(makeItem("alice", "hi"), stop) == Stage::Aborted);
    std::vector<bool> talking = {true, false};
    assert(rig.avatar.talkingCalls() == talking);
    assert(pipeline.stats().aborted == 1);

    // The next item is unaffected
    rig.playback.throw_on_play = false;
    assert(pipeline.process(makeItem("bob", "again"), stop) == Stage::Done);

    std::cout << "[PASS] test_playback_exception_still_stops_talking" << std::endl;
}

void test_avatar_refusal_does_not_block_playback() {
    Rig rig;
    rig.avatar.reject_talking = true;
    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{});
    StopSignal stop;

    assert(pipeline.process(makeItem("alice", "hi"), stop) == Stage::Done);
    assert(rig.playback.count() == 1);
    std::vector<bool> talking = {true, false};
    assert(rig.avatar.talkingCalls() == talking);
    assert(rig.feedback.messages.empty());

    std::cout << "[PASS] test_avatar_refusal_does_not_block_playback" << std::endl;
}

void test_stale_items_skipped() {
    Rig rig;
    PipelineConfig config;
    config.stale_after_ms = 10;
    ResponsePipeline pipeline(rig.queue, rig.deps(), config);

    rig.queue.enqueue(makeItem("alice", "old news"));
    rig.queue.enqueue(makeItem("boss", "admin never stale"));
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    rig.queue.stop();

    StopSignal stop;
    pipeline.run(stop);

    assert(rig.generator.seen.size() == 1);
    assert(rig.generator.seen[0] == "admin never stale");
    assert(pipeline.stats().stale_skipped == 1);
    assert(pipeline.stats().processed == 1);

    // Items handed in directly carry no enqueue time and are never stale
    assert(pipeline.process(makeItem("bob", "direct"), stop) == Stage::Done);
    assert(pipeline.stats().stale_skipped == 1);

    std::cout << "[PASS] test_stale_items_skipped" << std::endl;
}

void test_one_item_in_flight() {
    Rig rig;
    rig.playback.hold = true;
    ResponsePipeline pipeline(rig.queue, rig.deps(), PipelineConfig{});
    StopSignal stop;

    rig.queue.enqueue(makeItem("alice", "first"));
    rig.queue.enqueue(makeItem("bob", "second"));

    std::thread loop([&]() { pipeline.run(stop); });

    assert(rig.playback.waitUntilPlaying(std::chrono::seconds(2)));
    assert(pipeline.busy());
    auto current = pipeline.current();
    assert(current && current->stage == Stage::Playing);
    assert(current->content == "first");
    assert(rig.generator.seen.size() == 1);
    assert(rig.queue.size() == 1);

    // A direct call cannot start a second item alongside the loop
    assert(pipeline.process(makeItem("carol", "sneak in"), stop) == Stage::Aborted);
    assert(rig.generator.seen.size() == 1);

    stop.request();
    rig.queue.stop();
    rig.playback.release();
    loop.join();

    assert(rig.playback.finished == 1);
    std::vector<bool> talking = {true, false};
    assert(rig.avatar.talkingCalls() == talking);

    std::cout << "[PASS] test_one_item_in_flight" << std::endl;
}

int main() {
    std::cout << "=== ResponsePipeline Tests ===" << std::endl;

    test_happy_path();
    test_synthesis_failure_skips_playback_and_moves_on();
    test_generator_exception_aborts_only_that_item();
    test_suppressed_reply_is_not_spoken();
    test_non_finite_audio_aborts();
    test_missing_playback_aborts();
    test_playback_failure_still_stops_talking();
    test_playback_exception_still_stops_talking();
    test_avatar_refusal_does_not_block_playback();
    test_stale_items_skipped();
    test_one_item_in_flight();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
