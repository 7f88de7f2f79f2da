#ifndef LIVEDICT_WHISPER_ENGINE_HPP
#define LIVEDICT_WHISPER_ENGINE_HPP

#include "config.hpp"
#include "transcription.hpp"
#include "whisper.h"

#include <mutex>
#include <string>
#include <vector>

// whisper.cpp behind the TranscriptionPort.
//
// One model context; calls are serialized on it. Every call re-decodes the
// whole window from scratch (no_context), optionally primed with the
// caller's prompt.
class WhisperEngine : public TranscriptionPort {
public:
    explicit WhisperEngine(const DictationConfig& config);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    // Load the model. Returns false (and logs) on failure.
    bool init();

    bool isLoaded() const { return ctx_ != nullptr; }

    bool transcribe(const std::vector<float>& window,
                    const std::string& prompt,
                    Hypothesis& out) override;

private:
    DictationConfig config_;
    whisper_context* ctx_ = nullptr;
    std::mutex mutex_;
};

#endif // LIVEDICT_WHISPER_ENGINE_HPP
