#pragma once
// EntryStore.hpp
// Reads and writes the lexicon artifact, one JSON object per line:
//   {"w": "결근", "sources": ["표준국어대사전"], "score": 2.0}
// "score" is optional, missing scores fall back to the best configured source weight.
// "initials" is optional too and only cross-checked: the codec always derives them from the word,
// so an artifact written under one granularity still loads under the other.

#include <map>
#include <string>
#include <vector>
#include "InitialsCodec.hpp"
#include "LexiconEntry.hpp"

class EntryStore {
public:
    EntryStore();

    void set_source_weights(const std::map<std::string, double>& weights);
    double source_weight(const std::string& source) const;

    // Core methods for the artifact
    bool load_from_jsonl(const std::string& path, const InitialsCodec& codec);
    static bool save_to_jsonl(const std::string& path, const std::vector<LexiconEntry>& entries);

    void add(LexiconEntry entry);

    const std::vector<LexiconEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    size_t skipped_lines() const { return skipped_lines_; }
    size_t rederived_lines() const { return rederived_lines_; }

private:
    std::vector<LexiconEntry> entries_;
    std::map<std::string, double> source_weights_;
    size_t skipped_lines_ = 0;
    size_t rederived_lines_ = 0;  // stored initials disagreed with the codec
};
