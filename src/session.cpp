#include "session.hpp"

#include <iostream>
#include <vector>

static VADOptions vadOptionsFrom(const DictationConfig& config) {
    VADOptions options;
    options.sample_rate = kSampleRate;
    options.frame_ms = config.vad_frame_ms;
    options.enter_threshold = config.vad_enter_threshold;
    options.exit_threshold = config.vad_exit_threshold;
    options.enter_frames = config.vad_enter_frames;
    options.hangover_ms = config.hangover_ms;
    return options;
}

static SchedulerOptions schedulerOptionsFrom(const DictationConfig& config) {
    SchedulerOptions options;
    options.step_ms = config.step_ms;
    options.window_ms = config.window_ms;
    options.min_audio_ms = config.min_audio_ms;
    return options;
}

static HallucinationFilter filterFrom(const DictationConfig& config) {
    return HallucinationFilter(
        config.hallucinations.empty() ? HallucinationFilter::defaultFillers() : config.hallucinations,
        config.markers.empty() ? HallucinationFilter::defaultMarkers() : config.markers);
}

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle:       return "idle";
        case SessionState::Recording:  return "recording";
        case SessionState::Finalizing: return "finalizing";
    }
    return "unknown";
}

Session::Session(const std::string& id, const DictationConfig& config,
                 TranscriptionPort& engine, KeystrokeSink& sink)
    : id_(id)
    , config_(config)
    , audio_(config.buffer_seconds, kSampleRate)
    , vad_(vadOptionsFrom(config))
    , tracker_(config.stability_passes, filterFrom(config))
    , injector_(sink)
    , scheduler_(schedulerOptionsFrom(config), audio_, engine) {
}

void Session::setState(SessionState state) {
    state_ = state;
    if (callbacks_.on_state) callbacks_.on_state(state);
}

bool Session::start() {
    if (state() != SessionState::Idle) {
        std::cout << "[session:" << id_ << "] Start ignored (" << sessionStateName(state()) << ")" << std::endl;
        return false;
    }

    // Waits at most for the tail of a final pass that is handing back Idle
    std::lock_guard<std::mutex> pipeline(pipeline_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::Idle) return false;

    audio_.clear();
    {
        std::lock_guard<std::mutex> vad_lock(vad_mutex_);
        vad_.reset();
    }
    tracker_.reset();
    injector_.reset();
    scheduler_.reset();
    hangover_pending_ = false;

    setState(SessionState::Recording);
    std::cout << "[session:" << id_ << "] === RECORDING ===" << std::endl;
    return true;
}

bool Session::stop() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::Recording) {
        std::cout << "[session:" << id_ << "] Stop ignored (" << sessionStateName(state_) << ")" << std::endl;
        return false;
    }

    setState(SessionState::Finalizing);
    std::cout << "[session:" << id_ << "] Stop requested, final pass pending" << std::endl;
    return true;
}

bool Session::toggle(int64_t now_ms) {
    if (toggled_ && now_ms - last_toggle_ms_ < config_.toggle_debounce_ms) {
        std::cout << "[session:" << id_ << "] Toggle ignored (debounce "
                  << (now_ms - last_toggle_ms_) << "ms)" << std::endl;
        return false;
    }
    toggled_ = true;
    last_toggle_ms_ = now_ms;

    switch (state()) {
        case SessionState::Idle:       return start();
        case SessionState::Recording:  return stop();
        case SessionState::Finalizing: break;
    }
    return false;
}

void Session::onAudio(const int16_t* samples, size_t count) {
    if (state() != SessionState::Recording || count == 0) return;

    std::vector<float> converted = AudioBuffer::int16ToFloat(samples, count);
    onAudioFloat(converted.data(), converted.size());
}

void Session::onAudioFloat(const float* samples, size_t count) {
    if (state() != SessionState::Recording || count == 0) return;

    audio_.pushFloat(samples, count);

    VADResult result;
    {
        std::lock_guard<std::mutex> lock(vad_mutex_);
        result = vad_.process(samples, count);
    }

    if (result.speech_started) {
        std::cout << "[VAD:" << id_ << "] === SPEECH STARTED ===" << std::endl;
    }
    if (result.speech_ended) {
        std::cout << "[VAD:" << id_ << "] === SPEECH ENDED === (hangover "
                  << config_.hangover_ms << "ms)" << std::endl;
        hangover_pending_ = true;
    }
}

void Session::tick(int64_t now_ms) {
    std::lock_guard<std::mutex> pipeline(pipeline_mutex_);

    switch (state()) {
        case SessionState::Idle:
            return;
        case SessionState::Finalizing:
            runFinalPass(SealReason::Stop);
            return;
        case SessionState::Recording:
            break;
    }

    if (hangover_pending_.exchange(false)) {
        runFinalPass(SealReason::Hangover);
        return;
    }

    if (scheduler_.windowFull()) {
        if (speechSinceBoundary()) {
            std::cout << "[session:" << id_ << "] Window full without a pause, sealing utterance" << std::endl;
            runFinalPass(SealReason::WindowFull);
            return;
        }
        // Only silence since the boundary
        scheduler_.setBoundary(audio_.writePosition());
    }

    Hypothesis hyp;
    TickResult result = scheduler_.tick(now_ms, speechSinceBoundary(), prompt(), hyp);
    if (result == TickResult::Transcribed) {
        applyPass(hyp);
    } else if (config_.verbose && result != TickResult::NotDue) {
        std::cout << "[session:" << id_ << "] Tick skipped: " << tickResultName(result) << std::endl;
    }

    if (state() == SessionState::Finalizing) {
        runFinalPass(SealReason::Stop);
    }
}

void Session::applyPass(const Hypothesis& hyp) {
    if (!tracker_.update(hyp)) {
        // Non-speech output (blank audio, filler); nothing to show
        return;
    }

    if (config_.verbose) {
        std::cout << "[session:" << id_ << "] Pass " << hyp.pass << ": committed=\""
                  << tracker_.committedText() << "\" tentative=\"" << tracker_.tentativeText()
                  << "\"" << std::endl;
    }
    inject();
}

void Session::inject() {
    InjectResult result = injector_.update(tracker_.fullText());

    if (result == InjectResult::Failed) {
        std::cerr << "[session:" << id_ << "] WARNING: keystroke injection failed; "
                  << "edits for this pass dropped, resynchronizing from empty" << std::endl;
        return;
    }

    if (result == InjectResult::Applied && callbacks_.on_transcript) {
        callbacks_.on_transcript(tracker_.committedText(), tracker_.tentativeText());
    }
}

void Session::runFinalPass(SealReason reason) {
    const bool from_hangover = reason == SealReason::Hangover;
    const char* reason_name = reason == SealReason::Stop ? "stop"
                            : from_hangover ? "hangover" : "window full";
    const bool ends_session = reason == SealReason::Stop ||
        (from_hangover && config_.hangover_policy == HangoverPolicy::EndSession);

    if (from_hangover && ends_session) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Recording) setState(SessionState::Finalizing);
    }

    Hypothesis hyp;
    uint64_t end_position = 0;
    TickResult result = scheduler_.runFinal(speechSinceBoundary(), prompt(), hyp, &end_position);

    if (result == TickResult::Busy) {
        // Another call still holds the engine; retry on the next tick.
        // A full window is detected again without help.
        if (from_hangover && !ends_session) hangover_pending_ = true;
        return;
    }

    std::cout << "[session:" << id_ << "] Final pass ("
              << reason_name << "): " << tickResultName(result) << std::endl;

    if (result == TickResult::Transcribed) {
        tracker_.update(hyp);
    } else {
        // No terminal hypothesis; what is tentative now is final
        tracker_.finalize();
    }
    inject();

    scheduler_.setBoundary(end_position);
    {
        std::lock_guard<std::mutex> lock(vad_mutex_);
        vad_.markBoundary();
    }

    std::string final_text = tracker_.committedText();
    if (ends_session) {
        finish(final_text);
        return;
    }

    std::cout << "[session:" << id_ << "] === UTTERANCE COMMITTED ===" << std::endl;
    std::cout << "[session:" << id_ << "]   \"" << final_text << "\"" << std::endl;
    if (callbacks_.on_final) callbacks_.on_final(final_text);
}

void Session::finish(const std::string& final_text) {
    last_final_text_ = final_text;

    std::cout << "[session:" << id_ << "] === FINAL TRANSCRIPT ===" << std::endl;
    std::cout << "[session:" << id_ << "]   \"" << final_text << "\"" << std::endl;
    if (callbacks_.on_final) callbacks_.on_final(final_text);

    audio_.clear();
    {
        std::lock_guard<std::mutex> lock(vad_mutex_);
        vad_.reset();
    }
    hangover_pending_ = false;

    std::lock_guard<std::mutex> lock(state_mutex_);
    setState(SessionState::Idle);
}

void Session::onInjectionFailure(const std::string& reason) {
    std::cerr << "[session:" << id_ << "] WARNING: client could not apply edits ("
              << reason << "); resynchronizing from empty" << std::endl;
    injector_.markDesynced();
}

std::string Session::prompt() const {
    if (!config_.use_prompt) return "";
    return tracker_.promptText(static_cast<size_t>(config_.prompt_max_words));
}

std::string Session::committedText() const {
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    return tracker_.committedText();
}

std::string Session::tentativeText() const {
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    return tracker_.tentativeText();
}

std::string Session::injectedText() const {
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    return injector_.injectedText();
}

std::string Session::lastFinalText() const {
    std::lock_guard<std::mutex> lock(pipeline_mutex_);
    return last_final_text_;
}

uint64_t Session::passes() const {
    return scheduler_.passes();
}

VADState Session::vadState() const {
    std::lock_guard<std::mutex> lock(vad_mutex_);
    return vad_.state();
}

bool Session::speechSinceBoundary() const {
    std::lock_guard<std::mutex> lock(vad_mutex_);
    return vad_.speechSinceBoundary();
}
