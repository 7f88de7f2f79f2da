#ifndef LIVEDICT_STABILITY_TRACKER_HPP
#define LIVEDICT_STABILITY_TRACKER_HPP

#include "transcription.hpp"
#include "hallucination_filter.hpp"

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

// A tentative word and how long it has held still
struct TrackedToken {
    Token token;
    int match_count = 0;    // consecutive passes seen unchanged at this position, this one included
};

// Decides which words of a stream of full re-transcriptions are final.
//
// Every pass is aligned position by position against the previous pass's
// tentative words, starting after the words already committed for the
// current utterance. The first differing word and everything after it
// become fresh tentative words. The longest prefix that held still for
// `stability_passes` passes is committed. Committed words are append-only:
// nothing ever rewrites them.
//
// A final pass commits everything. It also seals the utterance: later
// hypotheses are expected to cover only audio after the final pass.
class StabilityTracker {
public:
    explicit StabilityTracker(int stability_passes = 2,
                              const HallucinationFilter& filter = HallucinationFilter());

    // Apply one pass. Returns false if the pass held no speech after
    // filtering and was ignored (non-final passes only).
    bool update(const Hypothesis& hyp);

    // Commit all tentative words and seal the utterance. Returns the
    // number of words promoted.
    size_t finalize();

    void reset();

    const std::vector<Token>& committed() const { return committed_; }
    const std::vector<TrackedToken>& tentative() const { return tentative_; }

    std::string committedText() const;
    std::string tentativeText() const;
    std::string fullText() const;

    // Trailing words of sealed text, used as decoder context
    std::string promptText(size_t max_words) const;

    // Committed words belonging to the open utterance
    size_t utteranceCommitted() const { return committed_.size() - sealed_; }

    uint64_t passes() const { return passes_; }
    int stabilityPasses() const { return stability_passes_; }

private:
    int stability_passes_;
    HallucinationFilter filter_;

    std::vector<Token> committed_;
    std::vector<TrackedToken> tentative_;
    size_t sealed_ = 0;         // committed_[0, sealed_) belongs to finished utterances
    uint64_t passes_ = 0;

    void align(const Hypothesis& hyp);
    size_t promoteStable();
    size_t promoteAll();
};

#endif // LIVEDICT_STABILITY_TRACKER_HPP
