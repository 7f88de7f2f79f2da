/**
 * Unit tests for DiffInjector
 *
 * A simulated text field checks that the edits emitted for each new
 * hypothesis leave exactly that hypothesis on screen.
 */

#include <catch2/catch_test_macros.hpp>
#include "diff_injector.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

// Split UTF-8 into code points by lead byte
static std::vector<std::string> codePoints(const std::string& text) {
    std::vector<std::string> out;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80 && !out.empty()) {
            out.back() += text[i];
        } else {
            out.push_back(std::string(1, text[i]));
        }
    }
    return out;
}

// ============================================================================
// UTF-8 helpers
// ============================================================================

TEST_CASE("Injector: utf8Length counts code points", "[injector][utf8]") {
    REQUIRE(utf8Length("") == 0);
    REQUIRE(utf8Length("abc") == 3);
    REQUIRE(utf8Length("café") == 4);
    REQUIRE(utf8Length("日本") == 2);
    REQUIRE(utf8Length("a😀b") == 3);
}

TEST_CASE("Injector: common prefix stops on a code point boundary", "[injector][utf8]") {
    REQUIRE(commonPrefixBytes("hello", "help") == 3);
    REQUIRE(commonPrefixBytes("", "abc") == 0);
    REQUIRE(commonPrefixBytes("same", "same") == 4);

    // "é" (C3 A9) and "è" (C3 A8) share a lead byte
    REQUIRE(commonPrefixBytes("caf\xC3\xA9", "caf\xC3\xA8") == 3);
}

// ============================================================================
// Edits
// ============================================================================

TEST_CASE("Injector: first text is typed in full", "[injector]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    REQUIRE(injector.update("hello") == InjectResult::Applied);
    REQUIRE(sink.ops == std::vector<std::string>{"insert:hello"});
    REQUIRE(sink.screen == "hello");
    REQUIRE(injector.injectedText() == "hello");
}

TEST_CASE("Injector: extension only appends", "[injector]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("hello wor");
    sink.ops.clear();

    injector.update("hello world");
    REQUIRE(sink.ops == std::vector<std::string>{"insert:ld"});
    REQUIRE(sink.screen == "hello world");
}

TEST_CASE("Injector: divergent suffix is deleted then retyped", "[injector]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("send the male");
    sink.ops.clear();

    injector.update("send the mail now");
    REQUIRE(sink.ops == std::vector<std::string>{"delete:2", "insert:il now"});
    REQUIRE(sink.screen == "send the mail now");
    REQUIRE(injector.deletedChars() == 2);
}

TEST_CASE("Injector: shorter text only deletes", "[injector]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("one two three");
    sink.ops.clear();

    injector.update("one two");
    REQUIRE(sink.ops == std::vector<std::string>{"delete:6"});
    REQUIRE(sink.screen == "one two");
}

TEST_CASE("Injector: identical text emits nothing", "[injector]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("same");
    sink.ops.clear();

    REQUIRE(injector.update("same") == InjectResult::Unchanged);
    REQUIRE(sink.ops.empty());
    REQUIRE(injector.update("") == InjectResult::Applied);
    REQUIRE(sink.screen.empty());
}

TEST_CASE("Injector: deletes count characters, not bytes", "[injector][utf8]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("naïve café");
    sink.ops.clear();

    injector.update("naïve cafés");
    REQUIRE(sink.ops == std::vector<std::string>{"insert:s"});

    sink.ops.clear();
    injector.update("naïf");
    REQUIRE(sink.ops == std::vector<std::string>{"delete:8", "insert:f"});
    REQUIRE(sink.screen == "naïf");
}

TEST_CASE("Injector: emoji are deleted as one character", "[injector][utf8]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("ok 😀");
    injector.update("ok");
    REQUIRE(sink.ops.back() == "delete:2");
    REQUIRE(sink.screen == "ok");
}

TEST_CASE("Injector: every pair of texts edits only past the shared prefix", "[injector][utf8]") {
    const std::vector<std::string> texts = {
        "",
        "a",
        "hello",
        "hello wor",
        "hello world",
        "help",
        "caf\xC3\xA9",            // café
        "caf\xC3\xA8",            // cafè, same lead byte as é
        "caf\xC3\xA9s",
        "na\xC3\xAFve",           // naïve
        "\xE6\x97\xA5\xE6\x9C\xAC",   // 日本
        "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E",  // 日本語
        "ok \xF0\x9F\x98\x80",  // ok 😀
        "ok \xF0\x9F\x98\x81",  // ok 😁
        "ok",
    };

    for (const auto& previous : texts) {
        for (const auto& next : texts) {
            CAPTURE(previous, next);

            RecordingSink sink;
            DiffInjector injector(sink);
            injector.update(previous);
            REQUIRE(sink.screen == previous);
            sink.ops.clear();

            REQUIRE(injector.update(next) != InjectResult::Failed);

            std::vector<std::string> before = codePoints(previous);
            std::vector<std::string> after = codePoints(next);
            size_t shared = 0;
            while (shared < before.size() && shared < after.size() && before[shared] == after[shared]) {
                ++shared;
            }

            std::string prefix;
            for (size_t i = 0; i < shared; ++i) prefix += before[i];
            std::string suffix = next.substr(prefix.size());

            std::vector<std::string> expected;
            if (before.size() > shared) expected.push_back("delete:" + std::to_string(before.size() - shared));
            if (!suffix.empty()) expected.push_back("insert:" + suffix);

            REQUIRE(commonPrefixBytes(previous, next) == prefix.size());
            REQUIRE(sink.ops == expected);
            REQUIRE(prefix + suffix == next);
            REQUIRE(sink.screen == next);
            REQUIRE(injector.injectedText() == next);
        }
    }
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("Injector: failed delete resets the baseline", "[injector][failure]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("hello wor");
    sink.fail_next_delete = true;

    REQUIRE(injector.update("hello there") == InjectResult::Failed);
    REQUIRE(injector.injectedText().empty());
    REQUIRE(injector.failures() == 1);

    // Next pass types from scratch, never computing deletes off stale state
    sink.ops.clear();
    REQUIRE(injector.update("hello there") == InjectResult::Applied);
    REQUIRE(sink.ops == std::vector<std::string>{"insert:hello there"});
}

TEST_CASE("Injector: failed insert resets the baseline", "[injector][failure]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    sink.fail_next_insert = true;
    REQUIRE(injector.update("hello") == InjectResult::Failed);
    REQUIRE(injector.injectedText().empty());

    REQUIRE(injector.update("hello") == InjectResult::Applied);
    REQUIRE(sink.screen == "hello");
}

TEST_CASE("Injector: markDesynced takes effect on the next update", "[injector][failure]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("hello");
    injector.markDesynced();
    REQUIRE(injector.injectedText() == "hello");

    sink.ops.clear();
    injector.update("hello world");
    REQUIRE(sink.ops == std::vector<std::string>{"insert:hello world"});
}

TEST_CASE("Injector: reset forgets what was typed", "[injector]") {
    RecordingSink sink;
    DiffInjector injector(sink);

    injector.update("first session");
    injector.reset();
    sink.ops.clear();

    injector.update("first");
    REQUIRE(sink.ops == std::vector<std::string>{"insert:first"});
}

TEST_CASE("Injector: result names", "[injector]") {
    REQUIRE(std::string(injectResultName(InjectResult::Unchanged)) == "unchanged");
    REQUIRE(std::string(injectResultName(InjectResult::Applied)) == "applied");
    REQUIRE(std::string(injectResultName(InjectResult::Failed)) == "failed");
}
