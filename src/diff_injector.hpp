#ifndef LIVEDICT_DIFF_INJECTOR_HPP
#define LIVEDICT_DIFF_INJECTOR_HPP

#include <atomic>
#include <string>
#include <cstddef>
#include <cstdint>

// Keystroke injection surface. Both calls act at the host's input focus
// and report failure per call (focus lost, permission revoked).
class KeystrokeSink {
public:
    virtual ~KeystrokeSink() = default;

    // Press backspace `count` times (one per character)
    virtual bool deleteChars(size_t count) = 0;

    // Type `text` (UTF-8)
    virtual bool insertText(const std::string& text) = 0;
};

enum class InjectResult { Unchanged, Applied, Failed };

const char* injectResultName(InjectResult result);

// Characters (UTF-8 code points) in `text`
size_t utf8Length(const std::string& text);

// Byte length of the longest common prefix of a and b that ends on a
// code point boundary
size_t commonPrefixBytes(const std::string& a, const std::string& b);

// Turns successive full-text hypotheses into prefix-anchored edits.
//
// For each new text: delete the characters after the common prefix with
// what was injected last time, then type the rest of the new text. The
// common prefix is never touched. On a sink failure the pass is abandoned
// and the baseline is reset to empty, since the host state is unknown.
//
// update() must be called from one thread at a time, in pass order.
class DiffInjector {
public:
    explicit DiffInjector(KeystrokeSink& sink);

    InjectResult update(const std::string& text);

    // New session: nothing is believed to be on screen
    void reset();

    // The host reported a failed edit. Safe from any thread; takes effect
    // on the next update().
    void markDesynced() { desynced_.store(true); }

    const std::string& injectedText() const { return last_injected_; }

    uint64_t deletedChars() const { return deleted_chars_; }
    uint64_t insertedChars() const { return inserted_chars_; }
    uint64_t failures() const { return failures_; }

private:
    KeystrokeSink& sink_;
    std::string last_injected_;
    std::atomic<bool> desynced_{false};

    uint64_t deleted_chars_ = 0;
    uint64_t inserted_chars_ = 0;
    uint64_t failures_ = 0;
};

#endif // LIVEDICT_DIFF_INJECTOR_HPP
