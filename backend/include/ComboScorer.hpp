#pragma once
// ComboScorer.hpp
// Scores single words and whole combinations
// Word score = dictionary score + length bonus per extra initial covered
// Combo score = mean word score - segment penalty per additional word,
// so compact combinations of long words beat chains of one-syllable words

#include <cstddef>
#include "LexiconEntry.hpp"

class ComboScorer {
public:
    ComboScorer();

    // Score contributed by one word, never negative
    double word_score(const LexiconEntry& entry) const;

    // Normalized score for a combo built from word_count words whose word scores sum to cumulative
    double combo_score(double cumulative, size_t word_count) const;

    // Configure weights (optional - uses defaults if not called).
    // Throws InvalidParameterError for negative weights
    void set_weights(double length_bonus, double segment_penalty);

    // Get current weights
    void get_weights(double& length_bonus, double& segment_penalty) const;

private:
    double length_bonus_;     // per initial beyond the first (default: 0.3)
    double segment_penalty_;  // per word beyond the first (default: 0.2)
};
