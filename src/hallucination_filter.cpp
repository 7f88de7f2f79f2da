#include "hallucination_filter.hpp"

#include <algorithm>
#include <cctype>

static bool opensMarker(const std::string& word) {
    return !word.empty() && (word.front() == '[' || word.front() == '(');
}

static char closerFor(char opener) {
    return opener == '[' ? ']' : ')';
}

// Closing bracket, possibly followed by trailing punctuation ("(music).")
static bool closesMarker(const std::string& word, char closer) {
    size_t end = word.find_last_not_of(".,!?;:");
    return end != std::string::npos && word[end] == closer;
}

HallucinationFilter::HallucinationFilter()
    : HallucinationFilter(defaultFillers()) {
}

static std::vector<std::string> normalizeAll(const std::vector<std::string>& phrases) {
    std::vector<std::string> out;
    for (const auto& phrase : phrases) {
        std::string normalized = HallucinationFilter::normalize(phrase);
        if (!normalized.empty()) out.push_back(normalized);
    }
    return out;
}

HallucinationFilter::HallucinationFilter(const std::vector<std::string>& fillers,
                                         const std::vector<std::string>& markers)
    : fillers_(normalizeAll(fillers))
    , markers_(normalizeAll(markers)) {
}

std::vector<std::string> HallucinationFilter::defaultFillers() {
    return {
        "Thank you.",
        "Thank you very much.",
        "Thanks for watching!",
        "Subscribe",
        "you",
        "Bye.",
    };
}

std::vector<std::string> HallucinationFilter::defaultMarkers() {
    return {
        "music",
        "upbeat music",
        "silence",
        "BLANK_AUDIO",
        "applause",
        "laughter",
        "inaudible",
    };
}

std::string HallucinationFilter::normalize(const std::string& text) {
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            pending_space = !out.empty();
        } else if (std::isalnum(uc) || uc >= 0x80 || c == '\'') {
            if (pending_space) out += ' ';
            pending_space = false;
            out += static_cast<char>(std::tolower(uc));
        }
    }
    return out;
}

bool HallucinationFilter::isFiller(const std::string& text) const {
    std::string normalized = normalize(text);
    return std::find(fillers_.begin(), fillers_.end(), normalized) != fillers_.end();
}

bool HallucinationFilter::isMarker(const std::string& text) const {
    std::string normalized = normalize(text);
    return std::find(markers_.begin(), markers_.end(), normalized) != markers_.end();
}

void HallucinationFilter::removeMarkers(std::vector<Token>& tokens) const {
    std::vector<Token> kept;
    kept.reserve(tokens.size());

    size_t i = 0;
    while (i < tokens.size()) {
        if (opensMarker(tokens[i].text)) {
            char closer = closerFor(tokens[i].text.front());

            size_t j = i;
            while (j < tokens.size() && !closesMarker(tokens[j].text, closer)) ++j;

            if (j < tokens.size()) {
                std::vector<Token> span(tokens.begin() + i, tokens.begin() + j + 1);
                if (closer == ']' || isMarker(joinTokens(span))) {
                    i = j + 1;
                    continue;
                }
            }
            // Unterminated bracket or a dictated parenthetical: keep it as text
        }
        kept.push_back(tokens[i]);
        ++i;
    }

    if (!kept.empty()) kept.front().space_before = false;
    tokens.swap(kept);
}

bool HallucinationFilter::apply(Hypothesis& hyp) const {
    removeMarkers(hyp.tokens);

    if (!hyp.tokens.empty() && isFiller(joinTokens(hyp.tokens))) {
        hyp.tokens.clear();
    }

    return !hyp.tokens.empty();
}
