/**
 * ResponsePipeline.hpp - Single consumer that turns queued items into speech
 *
 * Per item: Queued -> Generating -> Synthesizing -> PostProcessing ->
 * Playing -> Done, or Aborted from any non-terminal stage. Only one item is
 * ever between Generating and Playing; the playback sink and the avatar's
 * talking state are touched from this loop alone.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/audio/AudioPostProcessor.hpp"
#include "vox/core/Collaborators.hpp"
#include "vox/core/QueueManager.hpp"
#include "vox/core/StopSignal.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vox::core {

enum class Stage {
    Queued,
    Generating,
    Synthesizing,
    PostProcessing,
    Playing,
    Done,
    Aborted
};

const char* toString(Stage stage);

/// Ephemeral state of the item currently in flight.
struct PipelineRunContext {
    QueueItem item;
    Stage stage = Stage::Queued;
    std::atomic<bool> aborted{false};
    std::string reply_text;
    std::vector<float> audio;
    int sample_rate = 0;
};

struct InFlightSummary {
    std::string user_name;
    Source source = Source::Text;
    std::string content;
    Stage stage = Stage::Queued;
};

struct PipelineStats {
    uint64_t processed = 0;   // reached Done after playing
    uint64_t suppressed = 0;  // generator declined to answer
    uint64_t aborted = 0;
    uint64_t stale_skipped = 0;
    std::chrono::milliseconds last_duration{0};
};

struct PipelineDependencies {
    ReplyGenerator* generator = nullptr;
    SpeechSynthesizer* synthesizer = nullptr;
    PlaybackSink* playback = nullptr;
    AvatarController* avatar = nullptr;
    std::map<Source, FeedbackSink*> feedback;
};

struct PipelineCallbacks {
    std::function<void(const QueueItem&, Stage)> onStageChange;
    std::function<void(const QueueItem&, Stage, const std::string&)> onItemFinished;
};

class ResponsePipeline {
public:
    ResponsePipeline(QueueManager& queue,
                     PipelineDependencies deps,
                     const PipelineConfig& config,
                     PipelineCallbacks callbacks = {});

    ResponsePipeline(const ResponsePipeline&) = delete;
    ResponsePipeline& operator=(const ResponsePipeline&) = delete;

    /// Consumer loop. Returns when `stop` is requested (after the item in
    /// flight has finished) or when the queue reports stopped and drained.
    void run(const StopSignal& stop);

    PipelineStats stats() const;
    std::optional<InFlightSummary> current() const;
    bool busy() const { return busy_.load(); }

    /// Runs one item through every stage. Exposed for callers that drive
    /// the pipeline without the loop. Returns Aborted without touching the
    /// item if another item is already in flight.
    Stage process(const QueueItem& item, const StopSignal& stop);

private:
    struct RunResult {
        Stage stage = Stage::Done;
        std::string reason;
        bool suppressed = false;
        bool skipped = false;
    };

    RunResult runStages(PipelineRunContext& ctx, const StopSignal& stop);
    PlaybackResult play(PipelineRunContext& ctx);
    void signalTalking(bool talking);
    void enter(PipelineRunContext& ctx, Stage stage);
    void finish(PipelineRunContext& ctx, const RunResult& result, std::chrono::milliseconds elapsed);
    void feedback(const QueueItem& item, const std::string& message);
    bool isStale(const QueueItem& item) const;

    QueueManager& queue_;
    PipelineDependencies deps_;
    std::chrono::milliseconds stale_after_;
    PipelineCallbacks callbacks_;
    audio::AudioPostProcessor post_processor_;

    std::atomic<bool> busy_{false};
    mutable std::mutex status_mutex_;
    PipelineStats stats_;
    std::optional<InFlightSummary> current_;
};

} // namespace vox::core
