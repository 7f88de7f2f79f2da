#ifndef LIVEDICT_INFERENCE_SCHEDULER_HPP
#define LIVEDICT_INFERENCE_SCHEDULER_HPP

#include "audio_buffer.hpp"
#include "transcription.hpp"

#include <atomic>
#include <string>
#include <cstdint>

struct SchedulerOptions {
    int step_ms = 500;          // cadence of regular passes
    int window_ms = 12000;      // trailing audio handed to the engine
    int min_audio_ms = 100;     // shorter windows are not worth a call
};

enum class TickResult {
    NotDue,         // step_ms has not elapsed
    Busy,           // a call is still in flight; schedule point dropped
    NoSpeech,       // VAD saw no speech since the boundary
    TooShort,       // not enough audio since the boundary
    Failed,         // engine error, pass skipped
    Transcribed,    // `out` holds a new hypothesis
};

const char* tickResultName(TickResult result);

// Drives the transcription cadence for one session.
//
// Regular passes hand the engine the audio written since the last
// committed boundary (at most window_ms of it). Calls never overlap: a tick
// that lands while a call is outstanding is dropped rather than queued.
class InferenceScheduler {
public:
    InferenceScheduler(const SchedulerOptions& options,
                       AudioBuffer& audio,
                       TranscriptionPort& engine);

    // Regular pass, at most once per step_ms
    TickResult tick(int64_t now_ms, bool speech_since_boundary,
                    const std::string& prompt, Hypothesis& out);

    // Terminal pass over everything since the boundary. *end_position gets
    // the write cursor the pass covered, so the caller can move the boundary.
    TickResult runFinal(bool speech_since_boundary, const std::string& prompt,
                        Hypothesis& out, uint64_t* end_position);

    // Start counting from the current write position (new session)
    void reset();

    // The audio since the boundary is within one step of what a regular
    // window can hold. Past that point windows would no longer start at
    // the boundary, so the utterance has to be sealed first.
    bool windowFull() const;

    uint64_t boundary() const { return boundary_.load(); }
    void setBoundary(uint64_t position) { boundary_.store(position); }

    bool inFlight() const { return in_flight_.load(); }
    uint64_t passes() const { return pass_counter_.load(); }
    const SchedulerOptions& options() const { return options_; }

private:
    SchedulerOptions options_;
    AudioBuffer& audio_;
    TranscriptionPort& engine_;

    std::atomic<bool> in_flight_{false};
    std::atomic<uint64_t> boundary_{0};
    std::atomic<uint64_t> pass_counter_{0};
    int64_t last_tick_ms_ = 0;
    bool ticked_ = false;

    TickResult runPass(size_t max_samples, bool speech_since_boundary,
                       const std::string& prompt, bool is_final,
                       Hypothesis& out, uint64_t* end_position);
};

#endif // LIVEDICT_INFERENCE_SCHEDULER_HPP
