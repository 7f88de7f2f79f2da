#ifndef LIVEDICT_CONFIG_HPP
#define LIVEDICT_CONFIG_HPP

#include <string>
#include <vector>

// What the session does when VAD hangover finalizes an utterance
enum class HangoverPolicy {
    Continue,   // commit the text, keep recording until an explicit stop
    EndSession, // commit the text and return to idle
};

const char* hangoverPolicyName(HangoverPolicy policy);
bool parseHangoverPolicy(const std::string& name, HangoverPolicy& out);

// Server configuration
struct DictationConfig {
    std::string model_path = "models/ggml-base.en.bin";
    std::string language = "en";
    std::string host = "127.0.0.1";
    int port = 9090;
    std::string auth_token = "";     // empty = no token required
    int n_threads = 4;               // threads per inference
    bool use_gpu = true;
    bool flash_attn = true;
    bool translate = false;
    bool verbose = false;            // pass whisper.cpp's own logging through

    // Audio / scheduling
    float buffer_seconds = 12.0f;    // ring buffer capacity
    int step_ms = 500;               // run inference every N ms
    int window_ms = 12000;           // audio handed to each regular pass
    int min_audio_ms = 100;          // skip passes on less audio than this

    // VAD
    int vad_frame_ms = 30;
    float vad_enter_threshold = 0.01f;
    float vad_exit_threshold = 0.006f;
    int vad_enter_frames = 3;
    int hangover_ms = 600;           // silence before an utterance is finalized
    HangoverPolicy hangover_policy = HangoverPolicy::Continue;

    // Stability
    int stability_passes = 2;        // identical passes before words commit
    bool use_prompt = true;          // feed finalized text back as decoder context
    int prompt_max_words = 50;
    std::vector<std::string> hallucinations;  // empty = built-in list
    std::vector<std::string> markers;         // parenthesized non-speech markers; empty = built-in list

    // Session
    int toggle_debounce_ms = 200;
};

// Overlay keys from a JSON object file onto `config`.
// Returns false and fills `error` if the file is unreadable or invalid.
bool loadConfigFile(const std::string& path, DictationConfig& config, std::string& error);

// Overlay LIVEDICT_* environment variables
bool applyEnvironment(DictationConfig& config, std::string& error);

// Check cross-field constraints
bool validateConfig(const DictationConfig& config, std::string& error);

void printUsage(const char* prog);

// Full resolution: defaults, --config file, environment, flags, then
// validation. Returns false on --help or any error (already reported).
bool parseArgs(int argc, char** argv, DictationConfig& config);

#endif // LIVEDICT_CONFIG_HPP
