#pragma once
// LexiconEntry.hpp
// One dictionary headword with its initial-units, quality score and provenance.
// Validated on construction and read-only afterwards.

#include <string>
#include <vector>

class InitialsCodec;

class LexiconEntry {
public:
    // Throws InvalidParameterError for an empty word, empty initials,
    // a negative or non-finite score, or no sources
    LexiconEntry(std::string word,
                 std::vector<std::string> initials,
                 double score,
                 std::vector<std::string> sources);

    // Initials derived from the word itself
    static LexiconEntry from_word(const std::string& word,
                                  double score,
                                  std::vector<std::string> sources,
                                  const InitialsCodec& codec);

    const std::string& word() const { return word_; }
    const std::vector<std::string>& initials() const { return initials_; }
    double score() const { return score_; }
    const std::vector<std::string>& sources() const { return sources_; }
    size_t length() const { return initials_.size(); }

    bool has_source(const std::string& source) const;

private:
    std::string word_;
    std::vector<std::string> initials_;
    double score_;
    std::vector<std::string> sources_;  // sorted, unique
};

// Rank order used everywhere entries are listed: score descending, then word
bool entry_ranks_before(const LexiconEntry& a, const LexiconEntry& b);
