#include "whisper_engine.hpp"
#include "ggml-backend.h"

#include <iostream>

static_assert(WHISPER_SAMPLE_RATE == kSampleRate,
              "pipeline sample rate must match whisper's");

// Callback to silence whisper/ggml internal logging
static void whisper_log_disable(enum ggml_log_level, const char*, void*) {}

WhisperEngine::WhisperEngine(const DictationConfig& config)
    : config_(config) {
}

WhisperEngine::~WhisperEngine() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperEngine::init() {
    std::cout << "[whisper] Model: " << config_.model_path << std::endl;
    std::cout << "[whisper] GPU: " << (config_.use_gpu ? "enabled" : "disabled") << std::endl;

    if (!config_.verbose) {
        whisper_log_set(whisper_log_disable, nullptr);
    }

    // Load the backend
    ggml_backend_load_all();

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.use_gpu;
    cparams.flash_attn = config_.flash_attn;

    ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
    if (!ctx_) {
        std::cerr << "[whisper] Failed to load model " << config_.model_path << std::endl;
        return false;
    }

    std::cout << "[whisper] Model loaded (" << config_.n_threads << " threads, language="
              << config_.language << ")" << std::endl;
    return true;
}

bool WhisperEngine::transcribe(const std::vector<float>& window,
                               const std::string& prompt,
                               Hypothesis& out) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ctx_) {
        std::cerr << "[whisper] transcribe() before init()" << std::endl;
        return false;
    }
    if (window.empty()) {
        out = Hypothesis();
        return true;
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.translate = config_.translate;
    wparams.single_segment = false;
    wparams.max_tokens = 0;
    wparams.language = config_.language.c_str();
    wparams.n_threads = config_.n_threads;
    wparams.no_context = true;
    wparams.no_timestamps = true;
    wparams.suppress_blank = true;
    wparams.initial_prompt = prompt.empty() ? nullptr : prompt.c_str();

    if (whisper_full(ctx_, wparams, window.data(), static_cast<int>(window.size())) != 0) {
        std::cerr << "[whisper] Inference failed on " << window.size() << " samples" << std::endl;
        return false;
    }

    // Extract text from segments
    std::string text;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (segment_text) {
            if (!text.empty()) text += ' ';
            text += segment_text;
        }
    }

    out = Hypothesis();
    out.tokens = tokenizeText(text);
    return true;
}
