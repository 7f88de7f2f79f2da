#ifndef LIVEDICT_HALLUCINATION_FILTER_HPP
#define LIVEDICT_HALLUCINATION_FILTER_HPP

#include "transcription.hpp"

#include <string>
#include <vector>

// Strips whisper's non-speech output from a hypothesis.
//
// Square-bracketed spans ("[BLANK_AUDIO]", "[Music playing]") are removed
// wherever they appear. Parenthesized spans are removed only when their
// content is a known marker ("(music)", "(silence)"); anything else in
// parentheses was dictated. Filler phrases ("Thank you.", "you") are
// dropped only when they are the whole content of the pass, since they are
// real words when spoken inside a sentence.
class HallucinationFilter {
public:
    HallucinationFilter();
    explicit HallucinationFilter(const std::vector<std::string>& fillers,
                                 const std::vector<std::string>& markers = defaultMarkers());

    static std::vector<std::string> defaultFillers();
    static std::vector<std::string> defaultMarkers();

    // Filter in place. Returns true if any speech remains.
    bool apply(Hypothesis& hyp) const;

    // Lowercase, drop punctuation, collapse whitespace
    static std::string normalize(const std::string& text);

    bool isFiller(const std::string& text) const;

    // `text` is a parenthesized non-speech marker, brackets optional
    bool isMarker(const std::string& text) const;

private:
    std::vector<std::string> fillers_;    // normalized
    std::vector<std::string> markers_;    // normalized

    void removeMarkers(std::vector<Token>& tokens) const;
};

#endif // LIVEDICT_HALLUCINATION_FILTER_HPP
