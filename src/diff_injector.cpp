#include "diff_injector.hpp"

#include <algorithm>

// Byte length of the UTF-8 sequence starting with `lead`.
// Stray continuation and invalid bytes count as one character.
static size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

const char* injectResultName(InjectResult result) {
    switch (result) {
        case InjectResult::Unchanged: return "unchanged";
        case InjectResult::Applied:   return "applied";
        case InjectResult::Failed:    return "failed";
    }
    return "unknown";
}

size_t utf8Length(const std::string& text) {
    size_t count = 0;
    size_t i = 0;
    while (i < text.size()) {
        i += std::min(sequenceLength(static_cast<unsigned char>(text[i])), text.size() - i);
        ++count;
    }
    return count;
}

size_t commonPrefixBytes(const std::string& a, const std::string& b) {
    size_t i = 0;
    while (i < a.size() && i < b.size()) {
        size_t len = sequenceLength(static_cast<unsigned char>(a[i]));
        if (i + len > a.size() || i + len > b.size()) break;
        if (a.compare(i, len, b, i, len) != 0) break;
        i += len;
    }
    return i;
}

DiffInjector::DiffInjector(KeystrokeSink& sink)
    : sink_(sink) {
}

InjectResult DiffInjector::update(const std::string& text) {
    if (desynced_.exchange(false)) {
        last_injected_.clear();
    }

    if (text == last_injected_) {
        return InjectResult::Unchanged;
    }

    const size_t prefix = commonPrefixBytes(last_injected_, text);
    const size_t to_delete = utf8Length(last_injected_.substr(prefix));
    const std::string to_insert = text.substr(prefix);

    if (to_delete > 0 && !sink_.deleteChars(to_delete)) {
        ++failures_;
        last_injected_.clear();
        return InjectResult::Failed;
    }
    deleted_chars_ += to_delete;

    if (!to_insert.empty() && !sink_.insertText(to_insert)) {
        ++failures_;
        last_injected_.clear();
        return InjectResult::Failed;
    }
    inserted_chars_ += utf8Length(to_insert);

    last_injected_ = text;
    return InjectResult::Applied;
}

void DiffInjector::reset() {
    last_injected_.clear();
    desynced_.store(false);
}
