#ifndef LIVEDICT_TRANSCRIPTION_HPP
#define LIVEDICT_TRANSCRIPTION_HPP

#include <string>
#include <vector>
#include <cstdint>

// Audio format the whole pipeline runs at (mono float32)
constexpr int kSampleRate = 16000;

// One word of engine output
struct Token {
    std::string text;
    uint64_t pass = 0;          // inference pass that produced it
    bool space_before = false;  // engine put whitespace before this word
};

// Full re-transcription of one audio window
struct Hypothesis {
    std::vector<Token> tokens;
    uint64_t pass = 0;
    bool is_final = false;

    bool empty() const { return tokens.empty(); }
    std::string text() const;
};

// Split engine text into whitespace-delimited tokens tagged with `pass`.
// Leading/trailing whitespace is dropped.
std::vector<Token> tokenizeText(const std::string& text, uint64_t pass = 0);

// Join tokens back into text, one space where the engine had whitespace
std::string joinTokens(const std::vector<Token>& tokens);

// Trailing `max_words` tokens joined with single spaces
std::string lastWords(const std::vector<Token>& tokens, size_t max_words);

// Speech-to-text capability consumed by the scheduler.
//
// Each call is a stateless full transcription of `window` (16 kHz mono
// float32). Implementations must not keep references to `window` after
// returning, and callers never overlap calls. `prompt` is optional decoder
// context (previously finalized text). Returns false on failure, leaving
// `out` unspecified.
class TranscriptionPort {
public:
    virtual ~TranscriptionPort() = default;

    virtual bool transcribe(const std::vector<float>& window,
                            const std::string& prompt,
                            Hypothesis& out) = 0;
};

#endif // LIVEDICT_TRANSCRIPTION_HPP
