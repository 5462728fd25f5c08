#pragma once
// ComboSearch.hpp
// Level-synchronous beam search that assembles word combinations whose initials
// match a requested target, either in order (sequence mode) or as a multiset (bag mode)
//
// One level adds exactly one word to every open state, so states compared while pruning
// always have the same word count. Completed and stuck states are finalized into draft
// combos at every level regardless of the beam width; only open states are pruned.
// The index is read-only and every call owns its states, so concurrent calls are safe.

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "ComboScorer.hpp"
#include "LexiconIndex.hpp"

enum class SearchMode {
    Sequence,  // initials must match in the requested order
    Bag        // initials match as an unordered multiset
};

const char* to_string(SearchMode mode);
bool parse_search_mode(const std::string& text, SearchMode& out);

enum class EmptyTargetPolicy {
    Reject,        // throw EmptyTargetError (default)
    TrivialCombo   // return a single empty combo with full coverage
};

const char* to_string(EmptyTargetPolicy policy);
bool parse_empty_target_policy(const std::string& text, EmptyTargetPolicy& out);

// Cooperative cancellation, checked by the engine once per level before expanding it
class CancellationToken {
public:
    virtual ~CancellationToken() = default;

    void request_cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    virtual bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

struct SearchParams {
    SearchMode mode = SearchMode::Sequence;
    int beam_width = 64;
    int max_results = 20;
    int branch_limit = 32;             // candidates kept per exact initials sequence
    bool allow_repeated_words = true;  // same word more than once in one combo
    EmptyTargetPolicy empty_target = EmptyTargetPolicy::Reject;
    bool trace = false;
    const CancellationToken* cancel = nullptr;
};

struct Combo {
    std::string combo;                              // words concatenated
    std::vector<std::string> words;
    std::vector<double> word_scores;
    std::vector<std::vector<std::string>> word_sources;
    std::vector<std::string> matched_initials;      // initials covered, in word order
    double score = 0.0;
    SearchMode mode = SearchMode::Sequence;
    double coverage = 0.0;                          // matched units / requested units
};

// One step of the search, recorded only when SearchParams::trace is set
struct TraceEvent {
    std::string event;   // expand, extend, result, stuck, prune, cancel, complete
    int level = 0;
    std::vector<std::string> words;
    std::vector<std::string> remaining;
    double score = 0.0;
    size_t count = 0;    // candidates, frontier size or result count depending on event
};

struct SearchOutcome {
    std::vector<Combo> combos;
    bool cancelled = false;
    int levels = 0;
    std::vector<TraceEvent> trace;
};

class ComboSearchEngine {
public:
    explicit ComboSearchEngine(std::shared_ptr<const LexiconIndex> index, ComboScorer scorer = ComboScorer());

    // Deterministic for a fixed index and fixed parameters.
    // Throws InvalidParameterError for non-positive beam_width / max_results / branch_limit
    // or an empty unit, EmptyTargetError for an empty target under EmptyTargetPolicy::Reject
    SearchOutcome search(const std::vector<std::string>& target, const SearchParams& params) const;

    const LexiconIndex& index() const { return *index_; }
    const ComboScorer& scorer() const { return scorer_; }

private:
    struct BeamState {
        std::vector<const LexiconEntry*> words;
        size_t offset = 0;                   // sequence mode: units already matched
        std::map<std::string, int> residual; // bag mode: canonical remaining multiset
        size_t remaining = 0;                // units still to match
        double cumulative_score = 0.0;
    };

    std::shared_ptr<const LexiconIndex> index_;
    ComboScorer scorer_;

    std::vector<const LexiconEntry*> candidates(const BeamState& state,
                                                const std::vector<std::string>& target,
                                                const SearchParams& params) const;
    BeamState extend(const BeamState& state, const LexiconEntry& entry, SearchMode mode) const;
    std::string state_key(const BeamState& state, SearchMode mode) const;
    Combo finalize(const BeamState& state, SearchMode mode, size_t requested) const;
    std::vector<std::string> remaining_units(const BeamState& state,
                                             const std::vector<std::string>& target,
                                             SearchMode mode) const;
};
