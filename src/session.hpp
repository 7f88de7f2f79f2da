#ifndef LIVEDICT_SESSION_HPP
#define LIVEDICT_SESSION_HPP

#include "audio_buffer.hpp"
#include "config.hpp"
#include "diff_injector.hpp"
#include "inference_scheduler.hpp"
#include "stability_tracker.hpp"
#include "transcription.hpp"
#include "vad.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <cstdint>

enum class SessionState { Idle, Recording, Finalizing };

const char* sessionStateName(SessionState state);

// Observers for a session. Called from whichever thread caused the event,
// possibly with session locks held: they must not call back into Session.
struct SessionCallbacks {
    std::function<void(SessionState)> on_state;
    std::function<void(const std::string& committed, const std::string& tentative)> on_transcript;
    std::function<void(const std::string& text)> on_final;
};

// One dictation session: Idle -> Recording -> Finalizing -> Idle.
//
// Threads:
//   capture   onAudio()            ring buffer + VAD, never waits on inference
//   control   start/stop/toggle    state transitions
//   inference tick()               scheduling, stability, injection in pass order
//
// A stop that arrives while a call is in flight is recorded and served as
// soon as that call returns; the in-flight result is still applied.
class Session {
public:
    Session(const std::string& id, const DictationConfig& config,
            TranscriptionPort& engine, KeystrokeSink& sink);

    // Set before the session is shared between threads
    void setCallbacks(SessionCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    // Idle -> Recording. Ignored (false) in any other state.
    bool start();

    // Recording -> Finalizing. Ignored (false) in any other state.
    bool stop();

    // Hotkey toggle with debounce against key repeat
    bool toggle(int64_t now_ms);

    // Capture path: int16 PCM or float32, 16 kHz mono
    void onAudio(const int16_t* samples, size_t count);
    void onAudioFloat(const float* samples, size_t count);

    // Inference thread entry point, called frequently
    void tick(int64_t now_ms);

    // The host could not apply an edit
    void onInjectionFailure(const std::string& reason);

    SessionState state() const { return state_.load(); }
    const std::string& id() const { return id_; }

    std::string committedText() const;
    std::string tentativeText() const;
    std::string injectedText() const;
    std::string lastFinalText() const;
    uint64_t passes() const;
    VADState vadState() const;
    bool speechSinceBoundary() const;

private:
    std::string id_;
    DictationConfig config_;

    AudioBuffer audio_;
    VoiceActivityDetector vad_;
    StabilityTracker tracker_;
    DiffInjector injector_;
    InferenceScheduler scheduler_;
    SessionCallbacks callbacks_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::mutex state_mutex_;                // guards transitions
    mutable std::mutex pipeline_mutex_;     // tracker, injector, scheduler
    mutable std::mutex vad_mutex_;

    std::atomic<bool> hangover_pending_{false};
    bool toggled_ = false;
    int64_t last_toggle_ms_ = 0;
    std::string last_final_text_;

    // Why an utterance is being sealed
    enum class SealReason { Stop, Hangover, WindowFull };

    // Caller holds pipeline_mutex_
    void applyPass(const Hypothesis& hyp);
    void runFinalPass(SealReason reason);
    void inject();
    void finish(const std::string& final_text);
    std::string prompt() const;

    void setState(SessionState state);
};

#endif // LIVEDICT_SESSION_HPP
