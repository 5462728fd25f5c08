#pragma once
// LexiconIndex.hpp
// Immutable lexicon keyed by initial-units, built once and shared read-only between searches
// Wraps the reconciled entry list together with a Trie for prefix / exact lookups
// and a word map for direct validation ("is 결근 a word, and how good is it?")

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "InitialsCodec.hpp"
#include "LexiconEntry.hpp"
#include "Trie.hpp"

// What to do when the same (word, source) pair shows up twice with different scores
enum class ReconcilePolicy {
    KeepMax,          // keep the higher score (default)
    RejectConflicts   // refuse to build, throws DuplicateSourceConflictError
};

const char* to_string(ReconcilePolicy policy);
bool parse_reconcile_policy(const std::string& text, ReconcilePolicy& out);

class LexiconIndex {
public:
    // Entries sharing a word are merged: sources unioned, score = max,
    // initials taken from the best scored record
    static std::shared_ptr<const LexiconIndex> build(const std::vector<LexiconEntry>& entries,
                                                     ReconcilePolicy policy = ReconcilePolicy::KeepMax,
                                                     InitialsCodec codec = InitialsCodec());

    // Rebuild from a JSONL artifact written by save_to_jsonl (or by build_lexicon).
    // Throws std::runtime_error when the file is missing or holds no usable entry
    static std::shared_ptr<const LexiconIndex> load_from_jsonl(const std::string& path,
                                                               const std::map<std::string, double>& source_weights,
                                                               ReconcilePolicy policy = ReconcilePolicy::KeepMax,
                                                               InitialsCodec codec = InitialsCodec());

    bool save_to_jsonl(const std::string& path) const;

    // Entries whose initials begin with prefix, best first; limit 0 returns all of them
    std::vector<const LexiconEntry*> lookup_prefix(const std::vector<std::string>& prefix, size_t limit = 0) const;

    // Entries whose initials equal the argument, best first
    std::vector<const LexiconEntry*> lookup_exact(const std::vector<std::string>& initials) const;

    // Word validation
    const LexiconEntry* find(const std::string& word) const;
    bool contains(const std::string& word) const;
    std::optional<double> score_of(const std::string& word) const;

    // True if some entry's initials start with prefix (an empty prefix matches a non-empty index)
    bool has_prefix(const std::vector<std::string>& prefix) const;

    // True if some headword starts with text. The initials path only narrows the candidates,
    // under consonant granularity 결 and 가 share it.
    // Throws UnsupportedCharacterError when text is not Hangul
    bool has_word_prefix(const std::string& text) const;

    std::vector<const LexiconEntry*> words_starting_with(const std::string& unit, size_t limit) const;

    // Search support.
    // matches_along: entries whose initials are a prefix of units[offset..], shortest first.
    // matches_within: entries whose initials multiset fits inside bag.
    // Both keep at most per_node_limit entries for any one initials sequence.
    std::vector<const LexiconEntry*> matches_along(const std::vector<std::string>& units,
                                                   size_t offset,
                                                   size_t per_node_limit) const;
    std::vector<const LexiconEntry*> matches_within(const std::map<std::string, int>& bag,
                                                    size_t per_node_limit) const;

    const std::vector<LexiconEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    size_t node_count() const { return trie_.node_count(); }
    const InitialsCodec& codec() const { return codec_; }

private:
    LexiconIndex(std::vector<LexiconEntry> entries, InitialsCodec codec);

    std::vector<LexiconEntry> entries_;                    // rank order, id = position
    std::unordered_map<std::string, size_t> word_to_id_;
    Trie trie_;
    InitialsCodec codec_;

    void append_node(const TrieNode* node, size_t per_node_limit, std::vector<const LexiconEntry*>& out) const;
    void visit_within(const TrieNode* node,
                      std::map<std::string, int>& bag,
                      size_t per_node_limit,
                      std::vector<const LexiconEntry*>& out) const;
};
