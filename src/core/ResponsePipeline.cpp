/**
 * ResponsePipeline.cpp - Generate -> synthesize -> post-process -> play
 *
 * A failing stage aborts only the item in flight; the loop moves straight on
 * to the next queued item.
 */

#include "vox/core/ResponsePipeline.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace vox::core {

namespace {

std::string preview(const std::string& text, size_t max_len = 80) {
    if (text.size() <= max_len) return text;
    return text.substr(0, max_len) + "...";
}

} // anonymous namespace

const char* toString(Stage stage) {
    switch (stage) {
        case Stage::Queued: return "queued";
        case Stage::Generating: return "generating";
        case Stage::Synthesizing: return "synthesizing";
        case Stage::PostProcessing: return "post-processing";
        case Stage::Playing: return "playing";
        case Stage::Done: return "done";
        case Stage::Aborted: return "aborted";
    }
    return "unknown";
}

ResponsePipeline::ResponsePipeline(QueueManager& queue,
                                   PipelineDependencies deps,
                                   const PipelineConfig& config,
                                   PipelineCallbacks callbacks)
    : queue_(queue)
    , deps_(std::move(deps))
    , stale_after_(config.stale_after_ms)
    , callbacks_(std::move(callbacks))
{
    if (!deps_.generator) std::cerr << "[Pipeline] Warning: no reply generator, items will abort" << std::endl;
    if (!deps_.synthesizer) std::cerr << "[Pipeline] Warning: no speech synthesizer, items will abort" << std::endl;
    if (!deps_.playback) std::cerr << "[Pipeline] Warning: no playback sink, items will abort" << std::endl;
}

void ResponsePipeline::run(const StopSignal& stop) {
    std::cout << "[Pipeline] Processing loop started" << std::endl;

    while (!stop.requested()) {
        std::optional<QueueItem> item = queue_.dequeueBlocking();
        if (!item) {
            std::cout << "[Pipeline] Queue stopped and drained" << std::endl;
            break;
        }
        process(*item, stop);
    }

    std::cout << "[Pipeline] Processing loop stopped" << std::endl;
}

Stage ResponsePipeline::process(const QueueItem& item, const StopSignal& stop) {
    if (busy_.exchange(true)) {
        std::cerr << "[Pipeline] Refused item from " << item.user_name
                  << ": another item is in flight" << std::endl;
        return Stage::Aborted;
    }
    auto started = Clock::now();

    PipelineRunContext ctx;
    ctx.item = item;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        current_ = InFlightSummary{item.user_name, item.source, item.content, Stage::Queued};
    }

    std::cout << "[Pipeline] Processing [" << toString(item.source) << "] " << item.user_name
              << " | pending=" << queue_.size() << " | text='" << preview(item.content) << "'" << std::endl;

    RunResult result;
    if (isStale(item)) {
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(started - item.enqueued_at);
        result.stage = Stage::Done;
        result.skipped = true;
        result.reason = "stale, waited " + std::to_string(waited.count()) + "ms";
    } else {
        try {
            result = runStages(ctx, stop);
        } catch (const std::exception& e) {
            // Collaborators report failures by value; a throw is still only
            // this item's problem.
            result.stage = Stage::Aborted;
            result.reason = std::string("unexpected error in ") + toString(ctx.stage) + ": " + e.what();
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    finish(ctx, result, elapsed);
    return result.stage;
}

ResponsePipeline::RunResult ResponsePipeline::runStages(PipelineRunContext& ctx, const StopSignal& stop) {
    const QueueItem& item = ctx.item;
    RunResult result;

    auto abort = [&](std::string reason) {
        ctx.aborted = true;
        result.stage = Stage::Aborted;
        result.reason = std::move(reason);
        return result;
    };

    // Generating
    enter(ctx, Stage::Generating);
    if (!deps_.generator) {
        return abort("no reply generator available");
    }
    Reply reply = deps_.generator->generate(item.content, item.user_name, item.source);
    if (reply.status == ReplyStatus::Suppressed) {
        result.stage = Stage::Done;
        result.suppressed = true;
        result.reason = reply.reason;
        return result;
    }
    if (reply.status == ReplyStatus::Failed) {
        return abort("reply generation failed: " + reply.reason);
    }
    if (reply.text.empty()) {
        return abort("reply generation returned no text");
    }
    ctx.reply_text = std::move(reply.text);
    std::cout << "[Pipeline] Reply: " << preview(ctx.reply_text) << std::endl;

    // Synthesizing
    if (stop.requested()) return abort("shutting down");
    enter(ctx, Stage::Synthesizing);
    if (!deps_.synthesizer) {
        return abort("no speech synthesizer available");
    }
    Synthesis speech = deps_.synthesizer->synthesize(ctx.reply_text);
    if (!speech.ok) {
        return abort("speech synthesis failed: " + speech.error);
    }
    if (speech.samples.empty() || speech.sample_rate <= 0) {
        return abort("speech synthesis returned no audio");
    }
    ctx.audio = std::move(speech.samples);
    ctx.sample_rate = speech.sample_rate;
    std::cout << "[Pipeline] Synthesized " << ctx.audio.size() << " samples @ "
              << ctx.sample_rate << "Hz" << std::endl;

    // PostProcessing
    if (stop.requested()) return abort("shutting down");
    enter(ctx, Stage::PostProcessing);
    try {
        ctx.audio = post_processor_.process(ctx.audio, ctx.sample_rate);
    } catch (const std::invalid_argument& e) {
        return abort(std::string("audio rejected: ") + e.what());
    }

    // Playing: once started it always runs to completion
    if (stop.requested()) return abort("shutting down");
    if (!deps_.playback) {
        return abort("no playback sink available");
    }
    enter(ctx, Stage::Playing);
    PlaybackResult played = play(ctx);
    if (!played.ok) {
        return abort("playback failed: " + played.error);
    }

    result.stage = Stage::Done;
    return result;
}

PlaybackResult ResponsePipeline::play(PipelineRunContext& ctx) {
    signalTalking(true);

    PlaybackResult played;
    try {
        played = deps_.playback->play(ctx.audio, ctx.sample_rate);
    } catch (const std::exception& e) {
        played.ok = false;
        played.error = e.what();
    }

    // Never leave the avatar stuck in a talking pose
    signalTalking(false);
    return played;
}

void ResponsePipeline::signalTalking(bool talking) {
    if (!deps_.avatar) return;

    bool delivered = false;
    try {
        delivered = deps_.avatar->setTalking(talking);
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Avatar error: " << e.what() << std::endl;
    }
    if (!delivered) {
        std::cerr << "[Pipeline] Avatar talking=" << (talking ? "true" : "false")
                  << " not delivered (ignored)" << std::endl;
    }
}

void ResponsePipeline::enter(PipelineRunContext& ctx, Stage stage) {
    ctx.stage = stage;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (current_) current_->stage = stage;
    }
    if (callbacks_.onStageChange) {
        callbacks_.onStageChange(ctx.item, stage);
    }
}

void ResponsePipeline::finish(PipelineRunContext& ctx, const RunResult& result, std::chrono::milliseconds elapsed) {
    const QueueItem& item = ctx.item;

    if (result.stage == Stage::Aborted) {
        std::cerr << "[Pipeline] Aborted [" << toString(item.source) << "] " << item.user_name
                  << " at " << toString(ctx.stage) << ": " << result.reason << std::endl;
        feedback(item, "Sorry, I could not answer that (" + result.reason + ")");
    } else if (result.suppressed) {
        std::cout << "[Pipeline] No response for " << item.user_name << ": " << result.reason << std::endl;
        feedback(item, "Skipped your message: " + result.reason);
    } else if (result.skipped) {
        std::cout << "[Pipeline] Skipped " << item.user_name << ": " << result.reason << std::endl;
        feedback(item, "Skipped your message: " + result.reason);
    } else {
        std::cout << "[Pipeline] Completed in " << elapsed.count() << "ms" << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (result.stage == Stage::Aborted) {
            ++stats_.aborted;
        } else if (result.suppressed) {
            ++stats_.suppressed;
        } else if (result.skipped) {
            ++stats_.stale_skipped;
        } else {
            ++stats_.processed;
        }
        stats_.last_duration = elapsed;
        current_.reset();
    }
    busy_ = false;

    ctx.stage = result.stage;
    if (callbacks_.onStageChange) {
        callbacks_.onStageChange(item, result.stage);
    }
    if (callbacks_.onItemFinished) {
        callbacks_.onItemFinished(item, result.stage, result.reason);
    }
}

void ResponsePipeline::feedback(const QueueItem& item, const std::string& message) {
    auto it = deps_.feedback.find(item.source);
    if (it == deps_.feedback.end() || !it->second) return;
    it->second->sendFeedback(item, message);
}

bool ResponsePipeline::isStale(const QueueItem& item) const {
    // sequence 0 = never went through the queue, so enqueued_at is unset
    if (stale_after_.count() <= 0 || item.priority == Priority::Admin || item.sequence == 0) {
        return false;
    }
    return Clock::now() - item.enqueued_at > stale_after_;
}

PipelineStats ResponsePipeline::stats() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return stats_;
}

std::optional<InFlightSummary> ResponsePipeline::current() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return current_;
}

} // namespace vox::core
