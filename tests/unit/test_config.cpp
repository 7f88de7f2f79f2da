/**
 * Unit tests for configuration loading
 *
 * Resolution order: defaults, --config file, LIVEDICT_* environment,
 * command-line flags, then validation.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;

static std::string writeTempConfig(const std::string& name, const std::string& body) {
    std::string path = "livedict_test_" + name + ".json";
    std::ofstream out(path);
    out << body;
    return path;
}

// argv helper; parseArgs takes char**
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    Args(std::initializer_list<std::string> args) : storage(args) {
        for (auto& s : storage) argv.push_back(s.data());
        argv.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** data() { return argv.data(); }
};

TEST_CASE("Config: defaults are valid", "[config]") {
    DictationConfig config;
    std::string error;

    REQUIRE(validateConfig(config, error));
    REQUIRE(config.step_ms == 500);
    REQUIRE(config.stability_passes == 2);
    REQUIRE(config.hangover_policy == HangoverPolicy::Continue);
    REQUIRE(config.host == "127.0.0.1");
}

TEST_CASE("Config: hangover policy names", "[config]") {
    HangoverPolicy policy = HangoverPolicy::Continue;

    REQUIRE(parseHangoverPolicy("end", policy));
    REQUIRE(policy == HangoverPolicy::EndSession);
    REQUIRE(std::string(hangoverPolicyName(policy)) == "end");

    REQUIRE_FALSE(parseHangoverPolicy("stop", policy));
    REQUIRE(policy == HangoverPolicy::EndSession);
}

TEST_CASE("Config: validation rejects inconsistent settings", "[config][validate]") {
    std::string error;

    DictationConfig bad_port;
    bad_port.port = 70000;
    REQUIRE_FALSE(validateConfig(bad_port, error));

    DictationConfig thresholds;
    thresholds.vad_exit_threshold = 0.02f;
    REQUIRE_FALSE(validateConfig(thresholds, error));

    DictationConfig window;
    window.window_ms = 20000;
    REQUIRE_FALSE(validateConfig(window, error));

    DictationConfig hangover;
    hangover.hangover_ms = 60;  // 2 frames, not more than 3 enter frames
    REQUIRE_FALSE(validateConfig(hangover, error));

    DictationConfig stability;
    stability.stability_passes = 0;
    REQUIRE_FALSE(validateConfig(stability, error));
}

TEST_CASE("Config: file overlays defaults", "[config][file]") {
    std::string path = writeTempConfig("overlay", R"({
        "model": "models/ggml-small.en.bin",
        "port": 9191,
        "step_ms": 400,
        "hangover_policy": "end",
        "vad_enter_threshold": 0.02,
        "hallucinations": ["Okay."],
        "markers": ["static"]
    })");

    DictationConfig config;
    std::string error;
    REQUIRE(loadConfigFile(path, config, error));
    std::remove(path.c_str());

    REQUIRE(config.model_path == "models/ggml-small.en.bin");
    REQUIRE(config.port == 9191);
    REQUIRE(config.step_ms == 400);
    REQUIRE(config.hangover_policy == HangoverPolicy::EndSession);
    REQUIRE_THAT(config.vad_enter_threshold, WithinAbs(0.02f, 0.00001f));
    REQUIRE(config.hallucinations == std::vector<std::string>{"Okay."});
    REQUIRE(config.markers == std::vector<std::string>{"static"});

    // Untouched keys keep their defaults
    REQUIRE(config.window_ms == 12000);
}

TEST_CASE("Config: bad files are reported", "[config][file]") {
    DictationConfig config;
    std::string error;

    REQUIRE_FALSE(loadConfigFile("does/not/exist.json", config, error));
    REQUIRE_FALSE(error.empty());

    std::string syntax = writeTempConfig("syntax", "{ \"port\": ");
    REQUIRE_FALSE(loadConfigFile(syntax, config, error));
    std::remove(syntax.c_str());

    std::string types = writeTempConfig("types", R"({"port": "ninety"})");
    REQUIRE_FALSE(loadConfigFile(types, config, error));
    std::remove(types.c_str());

    std::string policy = writeTempConfig("policy", R"({"hangover_policy": "sometimes"})");
    REQUIRE_FALSE(loadConfigFile(policy, config, error));
    std::remove(policy.c_str());
}

TEST_CASE("Config: environment overrides the file", "[config][env]") {
    std::string path = writeTempConfig("env", R"({"port": 9191, "threads": 2})");

    setenv("LIVEDICT_PORT", "9292", 1);
    Args args{"livedict-server", "--config", path};
    DictationConfig config;
    bool ok = parseArgs(args.argc(), args.data(), config);
    unsetenv("LIVEDICT_PORT");
    std::remove(path.c_str());

    REQUIRE(ok);
    REQUIRE(config.port == 9292);
    REQUIRE(config.n_threads == 2);
}

TEST_CASE("Config: bad environment values are rejected", "[config][env]") {
    setenv("LIVEDICT_THREADS", "many", 1);
    DictationConfig config;
    std::string error;
    bool ok = applyEnvironment(config, error);
    unsetenv("LIVEDICT_THREADS");

    REQUIRE_FALSE(ok);
    REQUIRE(error.find("LIVEDICT_THREADS") != std::string::npos);
}

TEST_CASE("Config: flags override everything", "[config][args]") {
    Args args{"livedict-server", "-m", "m.bin", "-p", "9393", "--step", "250",
              "--hangover-policy", "end", "--stability", "3", "--no-prompt", "--no-gpu"};
    DictationConfig config;

    REQUIRE(parseArgs(args.argc(), args.data(), config));
    REQUIRE(config.model_path == "m.bin");
    REQUIRE(config.port == 9393);
    REQUIRE(config.step_ms == 250);
    REQUIRE(config.hangover_policy == HangoverPolicy::EndSession);
    REQUIRE(config.stability_passes == 3);
    REQUIRE_FALSE(config.use_prompt);
    REQUIRE_FALSE(config.use_gpu);
}

TEST_CASE("Config: malformed flags fail", "[config][args]") {
    DictationConfig config;

    Args number{"livedict-server", "--step", "fast"};
    REQUIRE_FALSE(parseArgs(number.argc(), number.data(), config));

    Args trailing{"livedict-server", "-p", "90x"};
    REQUIRE_FALSE(parseArgs(trailing.argc(), trailing.data(), config));

    Args unknown{"livedict-server", "--frobnicate"};
    REQUIRE_FALSE(parseArgs(unknown.argc(), unknown.data(), config));

    Args invalid{"livedict-server", "--stability", "0"};
    REQUIRE_FALSE(parseArgs(invalid.argc(), invalid.data(), config));
}
