#include "vad.hpp"

#include <algorithm>
#include <cmath>

const char* vadStateName(VADState state) {
    return state == VADState::Speech ? "speech" : "silence";
}

VoiceActivityDetector::VoiceActivityDetector(const VADOptions& options)
    : options_(options) {
    options_.frame_ms = std::max(1, options_.frame_ms);
    options_.enter_frames = std::max(1, options_.enter_frames);

    frame_samples_ = std::max<size_t>(
        1, static_cast<size_t>(options_.sample_rate) * options_.frame_ms / 1000);

    // Leaving speech must always take longer than entering it
    int hangover_frames = (options_.hangover_ms + options_.frame_ms - 1) / options_.frame_ms;
    exit_frames_ = std::max(options_.enter_frames + 1, hangover_frames);

    pending_.reserve(frame_samples_);
}

float VoiceActivityDetector::classify(const float* frame, size_t count) {
    if (count == 0) return 0.0f;

    double sum_sq = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum_sq += static_cast<double>(frame[i]) * frame[i];
    }
    return static_cast<float>(std::sqrt(sum_sq / count));
}

VADState VoiceActivityDetector::update(float energy) {
    if (energy > options_.enter_threshold) {
        ++frames_above_;
        frames_below_ = 0;
    } else if (energy < options_.exit_threshold) {
        ++frames_below_;
        frames_above_ = 0;
    } else {
        frames_above_ = 0;
        frames_below_ = 0;
    }

    switch (state_) {
        case VADState::Silence:
            if (frames_above_ >= options_.enter_frames) {
                state_ = VADState::Speech;
                speech_since_boundary_ = true;
            }
            break;

        case VADState::Speech:
            if (frames_below_ >= exit_frames_) {
                state_ = VADState::Silence;
            }
            break;
    }

    return state_;
}

VADResult VoiceActivityDetector::process(const float* samples, size_t count) {
    VADResult result;

    size_t offset = 0;
    while (offset < count) {
        size_t take = std::min(frame_samples_ - pending_.size(), count - offset);
        pending_.insert(pending_.end(), samples + offset, samples + offset + take);
        offset += take;

        if (pending_.size() < frame_samples_) break;

        VADState before = state_;
        VADState after = update(classify(pending_.data(), pending_.size()));
        pending_.clear();

        if (before == VADState::Silence && after == VADState::Speech) {
            result.speech_started = true;
        } else if (before == VADState::Speech && after == VADState::Silence) {
            result.speech_ended = true;
        }
    }

    result.state = state_;
    return result;
}

void VoiceActivityDetector::markBoundary() {
    speech_since_boundary_ = state_ == VADState::Speech;
}

void VoiceActivityDetector::reset() {
    state_ = VADState::Silence;
    frames_above_ = 0;
    frames_below_ = 0;
    speech_since_boundary_ = false;
    pending_.clear();
}
