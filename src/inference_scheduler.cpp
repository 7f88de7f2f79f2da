#include "inference_scheduler.hpp"

#include <algorithm>
#include <iostream>

namespace {

// Clears the in-flight flag when a pass ends, however it ends
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

const char* tickResultName(TickResult result) {
    switch (result) {
        case TickResult::NotDue:      return "not-due";
        case TickResult::Busy:        return "busy";
        case TickResult::NoSpeech:    return "no-speech";
        case TickResult::TooShort:    return "too-short";
        case TickResult::Failed:      return "failed";
        case TickResult::Transcribed: return "transcribed";
    }
    return "unknown";
}

InferenceScheduler::InferenceScheduler(const SchedulerOptions& options,
                                       AudioBuffer& audio,
                                       TranscriptionPort& engine)
    : options_(options)
    , audio_(audio)
    , engine_(engine) {
    boundary_ = audio_.writePosition();
}

void InferenceScheduler::reset() {
    boundary_ = audio_.writePosition();
    pass_counter_ = 0;
    ticked_ = false;
    last_tick_ms_ = 0;
}

bool InferenceScheduler::windowFull() const {
    size_t limit = std::min(audio_.msToSamples(options_.window_ms), audio_.capacity());
    size_t step = audio_.msToSamples(options_.step_ms);
    size_t threshold = limit > step ? limit - step : limit;

    uint64_t end = audio_.writePosition();
    uint64_t boundary = boundary_.load();
    return end > boundary && end - boundary >= threshold;
}

TickResult InferenceScheduler::tick(int64_t now_ms, bool speech_since_boundary,
                                    const std::string& prompt, Hypothesis& out) {
    if (ticked_ && now_ms - last_tick_ms_ < options_.step_ms) {
        return TickResult::NotDue;
    }
    ticked_ = true;
    last_tick_ms_ = now_ms;

    return runPass(audio_.msToSamples(options_.window_ms), speech_since_boundary,
                   prompt, false, out, nullptr);
}

TickResult InferenceScheduler::runFinal(bool speech_since_boundary, const std::string& prompt,
                                        Hypothesis& out, uint64_t* end_position) {
    return runPass(audio_.capacity(), speech_since_boundary, prompt, true, out, end_position);
}

TickResult InferenceScheduler::runPass(size_t max_samples, bool speech_since_boundary,
                                       const std::string& prompt, bool is_final,
                                       Hypothesis& out, uint64_t* end_position) {
    if (in_flight_.exchange(true)) {
        return TickResult::Busy;
    }
    InFlightGuard guard(in_flight_);

    // Snapshot first so the caller learns how far the window reached even
    // when the pass is skipped
    uint64_t end = 0;
    std::vector<float> window = audio_.getSince(boundary_.load(), max_samples, &end);
    if (end_position) *end_position = end;

    if (!speech_since_boundary) {
        return TickResult::NoSpeech;
    }

    if (window.size() < audio_.msToSamples(options_.min_audio_ms)) {
        return TickResult::TooShort;
    }

    Hypothesis hyp;
    if (!engine_.transcribe(window, prompt, hyp)) {
        std::cerr << "[scheduler] Inference failed ("
                  << (window.size() * 1000 / audio_.sampleRate()) << "ms window), pass skipped"
                  << std::endl;
        return TickResult::Failed;
    }

    hyp.pass = ++pass_counter_;
    hyp.is_final = is_final;
    for (auto& token : hyp.tokens) {
        token.pass = hyp.pass;
    }

    out = std::move(hyp);
    return TickResult::Transcribed;
}
