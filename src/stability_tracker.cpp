#include "stability_tracker.hpp"

#include <algorithm>

StabilityTracker::StabilityTracker(int stability_passes, const HallucinationFilter& filter)
    : stability_passes_(std::max(1, stability_passes))
    , filter_(filter) {
}

bool StabilityTracker::update(const Hypothesis& input) {
    Hypothesis hyp = input;

    if (!filter_.apply(hyp)) {
        if (!input.is_final) return false;

        // Nothing new was heard; what is on screen becomes final
        ++passes_;
        finalize();
        return true;
    }

    ++passes_;
    align(hyp);

    if (hyp.is_final) {
        finalize();
    } else {
        promoteStable();
    }
    return true;
}

void StabilityTracker::align(const Hypothesis& hyp) {
    const size_t offset = utteranceCommitted();

    std::vector<TrackedToken> next;
    if (hyp.tokens.size() > offset) next.reserve(hyp.tokens.size() - offset);

    bool diverged = false;
    for (size_t i = offset; i < hyp.tokens.size(); ++i) {
        const size_t k = i - offset;
        TrackedToken tracked;

        if (!diverged && k < tentative_.size() &&
            tentative_[k].token.text == hyp.tokens[i].text) {
            tracked.token = tentative_[k].token;
            tracked.match_count = tentative_[k].match_count + 1;
        } else {
            diverged = true;
            tracked.token = hyp.tokens[i];
            tracked.match_count = 1;

            // First word of a new utterance still needs a separator
            if (i == 0 && !committed_.empty()) tracked.token.space_before = true;
        }

        next.push_back(std::move(tracked));
    }

    // A shorter pass truncates the tentative tail
    tentative_.swap(next);
}

size_t StabilityTracker::promoteStable() {
    size_t stable = 0;
    while (stable < tentative_.size() &&
           tentative_[stable].match_count >= stability_passes_) {
        ++stable;
    }

    for (size_t i = 0; i < stable; ++i) {
        committed_.push_back(tentative_[i].token);
    }
    tentative_.erase(tentative_.begin(), tentative_.begin() + stable);
    return stable;
}

size_t StabilityTracker::promoteAll() {
    size_t count = tentative_.size();
    for (auto& tracked : tentative_) {
        committed_.push_back(tracked.token);
    }
    tentative_.clear();
    return count;
}

size_t StabilityTracker::finalize() {
    size_t promoted = promoteAll();
    sealed_ = committed_.size();
    return promoted;
}

void StabilityTracker::reset() {
    committed_.clear();
    tentative_.clear();
    sealed_ = 0;
    passes_ = 0;
}

std::string StabilityTracker::committedText() const {
    return joinTokens(committed_);
}

std::string StabilityTracker::tentativeText() const {
    std::vector<Token> tokens;
    tokens.reserve(tentative_.size());
    for (const auto& tracked : tentative_) tokens.push_back(tracked.token);
    return joinTokens(tokens);
}

std::string StabilityTracker::fullText() const {
    std::vector<Token> tokens(committed_);
    for (const auto& tracked : tentative_) tokens.push_back(tracked.token);
    return joinTokens(tokens);
}

std::string StabilityTracker::promptText(size_t max_words) const {
    std::vector<Token> sealed(committed_.begin(), committed_.begin() + sealed_);
    return lastWords(sealed, max_words);
}
