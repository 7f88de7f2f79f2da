#ifndef LIVEDICT_VAD_HPP
#define LIVEDICT_VAD_HPP

#include <vector>
#include <cstddef>
#include <cstdint>

enum class VADState { Silence, Speech };

const char* vadStateName(VADState state);

struct VADOptions {
    int sample_rate = 16000;
    int frame_ms = 30;              // classification frame
    float enter_threshold = 0.01f;  // RMS needed to count toward Speech
    float exit_threshold = 0.006f;  // RMS below which a frame counts toward Silence
    int enter_frames = 3;           // N consecutive loud frames to enter Speech
    int hangover_ms = 600;          // sustained quiet needed to leave Speech
};

// What happened while processing a chunk of audio
struct VADResult {
    VADState state = VADState::Silence;
    bool speech_started = false;
    bool speech_ended = false;      // hangover elapsed: Speech -> Silence
};

// Energy-based voice activity detector with two-threshold hysteresis.
//
// Entering Speech takes enter_frames consecutive frames above
// enter_threshold; leaving it takes exit_frames() consecutive frames below
// exit_threshold, where exit_frames() > enter_frames. A frame between the
// two thresholds breaks both runs. Not thread-safe.
class VoiceActivityDetector {
public:
    explicit VoiceActivityDetector(const VADOptions& options = VADOptions());

    // RMS amplitude of one frame
    static float classify(const float* frame, size_t count);

    // Advance the state machine by one frame's energy
    VADState update(float energy);

    // Split arbitrary-length audio into frames and update on each.
    // Leftover samples are kept for the next call.
    VADResult process(const float* samples, size_t count);

    VADState state() const { return state_; }
    bool isSpeaking() const { return state_ == VADState::Speech; }

    // Whether Speech was entered since the last markBoundary()/reset()
    bool speechSinceBoundary() const { return speech_since_boundary_; }
    void markBoundary();

    // Length of the current run of quiet frames
    int silenceMs() const { return frames_below_ * options_.frame_ms; }

    int exitFrames() const { return exit_frames_; }
    int framesAbove() const { return frames_above_; }
    int framesBelow() const { return frames_below_; }
    size_t frameSamples() const { return frame_samples_; }
    const VADOptions& options() const { return options_; }

    void reset();

private:
    VADOptions options_;
    size_t frame_samples_;
    int exit_frames_;

    VADState state_ = VADState::Silence;
    int frames_above_ = 0;
    int frames_below_ = 0;
    bool speech_since_boundary_ = false;

    std::vector<float> pending_;    // partial frame carried between calls
};

#endif // LIVEDICT_VAD_HPP
