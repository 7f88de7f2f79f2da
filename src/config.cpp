#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

const char* hangoverPolicyName(HangoverPolicy policy) {
    return policy == HangoverPolicy::EndSession ? "end" : "continue";
}

bool parseHangoverPolicy(const std::string& name, HangoverPolicy& out) {
    if (name == "continue") {
        out = HangoverPolicy::Continue;
        return true;
    }
    if (name == "end") {
        out = HangoverPolicy::EndSession;
        return true;
    }
    return false;
}

bool loadConfigFile(const std::string& path, DictationConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open config file " + path;
        return false;
    }

    static const std::set<std::string> known = {
        "model", "language", "host", "port", "token", "threads", "gpu",
        "flash_attn", "translate", "verbose", "buffer_seconds", "step_ms",
        "window_ms", "min_audio_ms", "vad_frame_ms", "vad_enter_threshold",
        "vad_exit_threshold", "vad_enter_frames", "hangover_ms",
        "hangover_policy", "stability_passes", "use_prompt",
        "prompt_max_words", "hallucinations", "markers", "toggle_debounce_ms",
    };

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            error = path + ": top level must be an object";
            return false;
        }

        for (const auto& item : j.items()) {
            if (known.count(item.key()) == 0) {
                std::cerr << "[livedict] Ignoring unknown config key '" << item.key() << "'" << std::endl;
            }
        }

        config.model_path = j.value("model", config.model_path);
        config.language = j.value("language", config.language);
        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        config.auth_token = j.value("token", config.auth_token);
        config.n_threads = j.value("threads", config.n_threads);
        config.use_gpu = j.value("gpu", config.use_gpu);
        config.flash_attn = j.value("flash_attn", config.flash_attn);
        config.translate = j.value("translate", config.translate);
        config.verbose = j.value("verbose", config.verbose);

        config.buffer_seconds = j.value("buffer_seconds", config.buffer_seconds);
        config.step_ms = j.value("step_ms", config.step_ms);
        config.window_ms = j.value("window_ms", config.window_ms);
        config.min_audio_ms = j.value("min_audio_ms", config.min_audio_ms);

        config.vad_frame_ms = j.value("vad_frame_ms", config.vad_frame_ms);
        config.vad_enter_threshold = j.value("vad_enter_threshold", config.vad_enter_threshold);
        config.vad_exit_threshold = j.value("vad_exit_threshold", config.vad_exit_threshold);
        config.vad_enter_frames = j.value("vad_enter_frames", config.vad_enter_frames);
        config.hangover_ms = j.value("hangover_ms", config.hangover_ms);

        if (j.contains("hangover_policy")) {
            std::string policy = j.at("hangover_policy").get<std::string>();
            if (!parseHangoverPolicy(policy, config.hangover_policy)) {
                error = path + ": hangover_policy must be \"continue\" or \"end\"";
                return false;
            }
        }

        config.stability_passes = j.value("stability_passes", config.stability_passes);
        config.use_prompt = j.value("use_prompt", config.use_prompt);
        config.prompt_max_words = j.value("prompt_max_words", config.prompt_max_words);
        if (j.contains("hallucinations")) {
            config.hallucinations = j.at("hallucinations").get<std::vector<std::string>>();
        }
        if (j.contains("markers")) {
            config.markers = j.at("markers").get<std::vector<std::string>>();
        }

        config.toggle_debounce_ms = j.value("toggle_debounce_ms", config.toggle_debounce_ms);
    } catch (const json::exception& e) {
        error = path + ": " + e.what();
        return false;
    }

    return true;
}

static bool parseIntValue(const std::string& name, const char* text, int& out, std::string& error) {
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos != std::strlen(text)) {
            error = "invalid integer for " + name + ": '" + text + "'";
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        error = "invalid integer for " + name + ": '" + text + "'";
        return false;
    }
}

static bool parseFloatValue(const std::string& name, const char* text, float& out, std::string& error) {
    try {
        size_t pos = 0;
        float value = std::stof(text, &pos);
        if (pos != std::strlen(text)) {
            error = "invalid number for " + name + ": '" + text + "'";
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        error = "invalid number for " + name + ": '" + text + "'";
        return false;
    }
}

bool applyEnvironment(DictationConfig& config, std::string& error) {
    if (const char* v = std::getenv("LIVEDICT_MODEL")) config.model_path = v;
    if (const char* v = std::getenv("LIVEDICT_LANGUAGE")) config.language = v;
    if (const char* v = std::getenv("LIVEDICT_HOST")) config.host = v;
    if (const char* v = std::getenv("LIVEDICT_TOKEN")) config.auth_token = v;

    if (const char* v = std::getenv("LIVEDICT_PORT")) {
        if (!parseIntValue("LIVEDICT_PORT", v, config.port, error)) return false;
    }
    if (const char* v = std::getenv("LIVEDICT_THREADS")) {
        if (!parseIntValue("LIVEDICT_THREADS", v, config.n_threads, error)) return false;
    }
    return true;
}

bool validateConfig(const DictationConfig& config, std::string& error) {
    if (config.port <= 0 || config.port > 65535) {
        error = "port must be in 1-65535";
        return false;
    }
    if (config.n_threads <= 0) {
        error = "threads must be positive";
        return false;
    }
    if (config.buffer_seconds <= 0.0f || config.step_ms <= 0 || config.window_ms <= 0 ||
        config.min_audio_ms < 0 || config.vad_frame_ms <= 0 || config.hangover_ms <= 0) {
        error = "durations must be positive";
        return false;
    }
    if (config.window_ms > static_cast<int>(config.buffer_seconds * 1000.0f)) {
        error = "window must fit in the audio buffer";
        return false;
    }
    if (config.vad_exit_threshold > config.vad_enter_threshold) {
        error = "VAD exit threshold must not exceed the enter threshold";
        return false;
    }
    if (config.vad_enter_frames < 1) {
        error = "VAD enter frames must be at least 1";
        return false;
    }
    int hangover_frames = (config.hangover_ms + config.vad_frame_ms - 1) / config.vad_frame_ms;
    if (hangover_frames <= config.vad_enter_frames) {
        error = "hangover must span more VAD frames than entering speech does";
        return false;
    }
    if (config.stability_passes < 1) {
        error = "stability passes must be at least 1";
        return false;
    }
    if (config.prompt_max_words < 0 || config.toggle_debounce_ms < 0) {
        error = "counts must not be negative";
        return false;
    }
    return true;
}

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -m, --model PATH          Path to whisper model (default: models/ggml-base.en.bin)\n"
              << "      --config PATH         JSON config file (flags override it)\n"
              << "  -p, --port PORT           Port to listen on (default: 9090)\n"
              << "      --host ADDRESS        Bind address (default: 127.0.0.1)\n"
              << "      --token SECRET        Authentication token for the client connection\n"
              << "  -t, --threads N           Threads per inference (default: 4)\n"
              << "  -l, --language LANG       Language code (default: en)\n"
              << "      --no-gpu              Disable GPU acceleration\n"
              << "      --translate           Translate to English\n"
              << "      --buffer SECONDS      Audio ring buffer length (default: 12)\n"
              << "      --step MS             Inference step interval in ms (default: 500)\n"
              << "      --window MS           Audio window per pass in ms (default: 12000)\n"
              << "      --vad-enter N         RMS threshold to enter speech (default: 0.01)\n"
              << "      --vad-exit N          RMS threshold to leave speech (default: 0.006)\n"
              << "      --vad-frames N        Loud frames needed to enter speech (default: 3)\n"
              << "      --hangover MS         Silence that finalizes an utterance (default: 600)\n"
              << "      --hangover-policy P   continue | end (default: continue)\n"
              << "      --stability N         Identical passes before words commit (default: 2)\n"
              << "      --no-prompt           Do not feed finalized text back to the decoder\n"
              << "  -v, --verbose             Show whisper.cpp logging\n"
              << "  -h, --help                Show this help\n"
              << "\nEnvironment: LIVEDICT_MODEL, LIVEDICT_LANGUAGE, LIVEDICT_HOST, LIVEDICT_PORT,\n"
              << "             LIVEDICT_TOKEN, LIVEDICT_THREADS\n"
              << std::endl;
}

bool parseArgs(int argc, char** argv, DictationConfig& config) {
    std::string error;

    // The config file sits below the environment and the flags, so find it first
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            if (!loadConfigFile(argv[i + 1], config, error)) {
                std::cerr << "Error: " << error << std::endl;
                return false;
            }
            break;
        }
    }

    if (!applyEnvironment(config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        bool ok = true;

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return false;
        }
        else if (arg == "--config" && has_value) {
            ++i;    // already loaded
        }
        else if ((arg == "-m" || arg == "--model") && has_value) {
            config.model_path = argv[++i];
        }
        else if ((arg == "-p" || arg == "--port") && has_value) {
            ok = parseIntValue(arg, argv[++i], config.port, error);
        }
        else if (arg == "--host" && has_value) {
            config.host = argv[++i];
        }
        else if (arg == "--token" && has_value) {
            config.auth_token = argv[++i];
        }
        else if ((arg == "-t" || arg == "--threads") && has_value) {
            ok = parseIntValue(arg, argv[++i], config.n_threads, error);
        }
        else if ((arg == "-l" || arg == "--language") && has_value) {
            config.language = argv[++i];
        }
        else if (arg == "--no-gpu") {
            config.use_gpu = false;
        }
        else if (arg == "--translate") {
            config.translate = true;
        }
        else if (arg == "--buffer" && has_value) {
            ok = parseFloatValue(arg, argv[++i], config.buffer_seconds, error);
        }
        else if (arg == "--step" && has_value) {
            ok = parseIntValue(arg, argv[++i], config.step_ms, error);
        }
        else if (arg == "--window" && has_value) {
            ok = parseIntValue(arg, argv[++i], config.window_ms, error);
        }
        else if (arg == "--vad-enter" && has_value) {
            ok = parseFloatValue(arg, argv[++i], config.vad_enter_threshold, error);
        }
        else if (arg == "--vad-exit" && has_value) {
            ok = parseFloatValue(arg, argv[++i], config.vad_exit_threshold, error);
        }
        else if (arg == "--vad-frames" && has_value) {
            ok = parseIntValue(arg, argv[++i], config.vad_enter_frames, error);
        }
        else if (arg == "--hangover" && has_value) {
            ok = parseIntValue(arg, argv[++i], config.hangover_ms, error);
        }
        else if (arg == "--hangover-policy" && has_value) {
            std::string policy = argv[++i];
            if (!parseHangoverPolicy(policy, config.hangover_policy)) {
                error = "--hangover-policy must be continue or end";
                ok = false;
            }
        }
        else if (arg == "--stability" && has_value) {
            ok = parseIntValue(arg, argv[++i], config.stability_passes, error);
        }
        else if (arg == "--no-prompt") {
            config.use_prompt = false;
        }
        else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return false;
        }

        if (!ok) {
            std::cerr << "Error: " << error << std::endl;
            return false;
        }
    }

    if (!validateConfig(config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return false;
    }

    return true;
}
