#include "ComboSearch.hpp"
#include "ComboErrors.hpp"
#include "ComboRanker.hpp"

#include <algorithm>
#include <unordered_set>

namespace {

bool word_sequence_less(const std::vector<const LexiconEntry*>& a, const std::vector<const LexiconEntry*>& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](const LexiconEntry* x, const LexiconEntry* y) { return x->word() < y->word(); });
}

// Bag-mode output order: longer initials first, then the word itself
bool canonical_less(const LexiconEntry* a, const LexiconEntry* b) {
    if (a->length() != b->length()) return a->length() > b->length();
    return a->word() < b->word();
}

std::vector<std::string> words_of(const std::vector<const LexiconEntry*>& entries) {
    std::vector<std::string> words;
    words.reserve(entries.size());
    for (const auto* e : entries) words.push_back(e->word());
    return words;
}

std::string join_words(const std::vector<std::string>& words) {
    std::string key;
    for (const auto& w : words) {
        key += w;
        key += '\x1f';
    }
    return key;
}

} // namespace

const char* to_string(SearchMode mode) {
    return mode == SearchMode::Bag ? "bag" : "sequence";
}

bool parse_search_mode(const std::string& text, SearchMode& out) {
    if (text == "sequence") {
        out = SearchMode::Sequence;
        return true;
    }
    if (text == "bag") {
        out = SearchMode::Bag;
        return true;
    }
    return false;
}

const char* to_string(EmptyTargetPolicy policy) {
    return policy == EmptyTargetPolicy::TrivialCombo ? "trivial" : "reject";
}

bool parse_empty_target_policy(const std::string& text, EmptyTargetPolicy& out) {
    if (text == "reject") {
        out = EmptyTargetPolicy::Reject;
        return true;
    }
    if (text == "trivial") {
        out = EmptyTargetPolicy::TrivialCombo;
        return true;
    }
    return false;
}

ComboSearchEngine::ComboSearchEngine(std::shared_ptr<const LexiconIndex> index, ComboScorer scorer)
    : index_(std::move(index)), scorer_(scorer) {
    if (!index_) {
        throw InvalidParameterError("combo search needs a lexicon index");
    }
}

SearchOutcome ComboSearchEngine::search(const std::vector<std::string>& target, const SearchParams& params) const {
    if (params.beam_width <= 0) {
        throw InvalidParameterError("beam_width must be positive, got " + std::to_string(params.beam_width));
    }
    if (params.max_results <= 0) {
        throw InvalidParameterError("max_results must be positive, got " + std::to_string(params.max_results));
    }
    if (params.branch_limit <= 0) {
        throw InvalidParameterError("branch_limit must be positive, got " + std::to_string(params.branch_limit));
    }
    for (const auto& unit : target) {
        if (unit.empty()) throw InvalidParameterError("target contains an empty initial-unit");
    }

    SearchOutcome outcome;
    const SearchMode mode = params.mode;

    if (target.empty()) {
        if (params.empty_target == EmptyTargetPolicy::Reject) {
            throw EmptyTargetError("target has no initials");
        }
        Combo trivial;
        trivial.mode = mode;
        trivial.coverage = 1.0;
        outcome.combos.push_back(trivial);
        return outcome;
    }

    auto record = [&](const char* event, int level, const BeamState& state, size_t count) {
        if (!params.trace) return;
        TraceEvent ev;
        ev.event = event;
        ev.level = level;
        ev.words = words_of(state.words);
        ev.remaining = remaining_units(state, target, mode);
        ev.score = state.cumulative_score;
        ev.count = count;
        outcome.trace.push_back(std::move(ev));
    };

    const size_t requested = target.size();
    const size_t beam_width = static_cast<size_t>(params.beam_width);
    const size_t max_results = static_cast<size_t>(params.max_results);

    BeamState root;
    root.remaining = requested;
    if (mode == SearchMode::Bag) {
        for (const auto& unit : target) ++root.residual[unit];
    }

    std::vector<BeamState> frontier;
    frontier.push_back(root);

    std::vector<Combo> drafts;
    std::unordered_set<std::string> finalized;
    size_t completed = 0;
    int level = 0;

    while (!frontier.empty() && completed < max_results) {
        if (params.cancel != nullptr && params.cancel->is_cancelled()) {
            outcome.cancelled = true;
            record("cancel", level, BeamState(), drafts.size());
            break;
        }

        std::vector<BeamState> successors;
        for (const auto& state : frontier) {
            std::vector<const LexiconEntry*> options = candidates(state, target, params);
            record("expand", level, state, options.size());

            if (options.empty()) {
                // Stuck: keep what was matched as a partial combo instead of dropping it
                if (!state.words.empty()) {
                    Combo partial = finalize(state, mode, requested);
                    if (finalized.insert(join_words(partial.words)).second) {
                        drafts.push_back(std::move(partial));
                        record("stuck", level, state, 0);
                    }
                }
                continue;
            }

            for (const LexiconEntry* entry : options) {
                BeamState next = extend(state, *entry, mode);
                if (next.remaining == 0) {
                    Combo complete = finalize(next, mode, requested);
                    if (finalized.insert(join_words(complete.words)).second) {
                        drafts.push_back(std::move(complete));
                        ++completed;
                        record("result", level, next, completed);
                    }
                } else {
                    record("extend", level, next, 0);
                    successors.push_back(std::move(next));
                }
            }
        }

        std::sort(successors.begin(), successors.end(), [](const BeamState& a, const BeamState& b) {
            if (a.cumulative_score != b.cumulative_score) return a.cumulative_score > b.cumulative_score;
            return word_sequence_less(a.words, b.words);
        });

        // Merge states reaching the same key (the first one is the best), then prune to the beam
        std::unordered_set<std::string> seen;
        std::vector<BeamState> next_frontier;
        next_frontier.reserve(std::min(beam_width, successors.size()));
        for (auto& state : successors) {
            if (next_frontier.size() >= beam_width) break;
            if (!seen.insert(state_key(state, mode)).second) continue;
            next_frontier.push_back(std::move(state));
        }

        frontier.swap(next_frontier);
        ++level;
        if (params.trace) {
            TraceEvent ev;
            ev.event = "prune";
            ev.level = level;
            ev.count = frontier.size();
            outcome.trace.push_back(std::move(ev));
        }
    }

    outcome.levels = level;
    outcome.combos = ComboRanker().rank(std::move(drafts), max_results);

    if (params.trace) {
        TraceEvent ev;
        ev.event = "complete";
        ev.level = level;
        ev.count = outcome.combos.size();
        outcome.trace.push_back(std::move(ev));
    }
    return outcome;
}

std::vector<const LexiconEntry*> ComboSearchEngine::candidates(const BeamState& state,
                                                               const std::vector<std::string>& target,
                                                               const SearchParams& params) const {
    const size_t limit = static_cast<size_t>(params.branch_limit);
    std::vector<const LexiconEntry*> options = params.mode == SearchMode::Sequence
        ? index_->matches_along(target, state.offset, limit)
        : index_->matches_within(state.residual, limit);

    if (!params.allow_repeated_words && !state.words.empty()) {
        options.erase(std::remove_if(options.begin(), options.end(), [&](const LexiconEntry* e) {
            return std::find(state.words.begin(), state.words.end(), e) != state.words.end();
        }), options.end());
    }
    return options;
}

ComboSearchEngine::BeamState ComboSearchEngine::extend(const BeamState& state,
                                                       const LexiconEntry& entry,
                                                       SearchMode mode) const {
    BeamState next = state;
    next.words.push_back(&entry);
    next.cumulative_score += scorer_.word_score(entry);
    next.remaining -= entry.length();

    if (mode == SearchMode::Sequence) {
        next.offset += entry.length();
    } else {
        for (const auto& unit : entry.initials()) {
            auto it = next.residual.find(unit);
            if (--it->second == 0) next.residual.erase(it);
        }
    }
    return next;
}

std::string ComboSearchEngine::state_key(const BeamState& state, SearchMode mode) const {
    if (mode == SearchMode::Sequence) {
        return join_words(words_of(state.words));
    }

    // Canonical residual plus the word multiset: permutations of the same words collapse
    std::string key;
    for (const auto& unit : state.residual) {
        key += unit.first;
        key += ':';
        key += std::to_string(unit.second);
        key += ';';
    }
    key += '|';
    std::vector<std::string> words = words_of(state.words);
    std::sort(words.begin(), words.end());
    key += join_words(words);
    return key;
}

Combo ComboSearchEngine::finalize(const BeamState& state, SearchMode mode, size_t requested) const {
    std::vector<const LexiconEntry*> words = state.words;
    if (mode == SearchMode::Bag) {
        std::sort(words.begin(), words.end(), canonical_less);
    }

    Combo combo;
    combo.mode = mode;

    // Summed in output order so equal word multisets get bit-identical scores
    double cumulative = 0.0;
    size_t matched = 0;
    for (const LexiconEntry* entry : words) {
        double ws = scorer_.word_score(*entry);
        combo.words.push_back(entry->word());
        combo.combo += entry->word();
        combo.word_scores.push_back(ws);
        combo.word_sources.push_back(entry->sources());
        combo.matched_initials.insert(combo.matched_initials.end(), entry->initials().begin(), entry->initials().end());
        cumulative += ws;
        matched += entry->length();
    }

    combo.score = scorer_.combo_score(cumulative, words.size());
    combo.coverage = requested == 0 ? 1.0 : static_cast<double>(matched) / static_cast<double>(requested);
    return combo;
}

std::vector<std::string> ComboSearchEngine::remaining_units(const BeamState& state,
                                                            const std::vector<std::string>& target,
                                                            SearchMode mode) const {
    std::vector<std::string> units;
    if (mode == SearchMode::Sequence) {
        if (state.offset < target.size()) units.assign(target.begin() + static_cast<std::ptrdiff_t>(state.offset), target.end());
        return units;
    }
    for (const auto& unit : state.residual) {
        units.insert(units.end(), static_cast<size_t>(unit.second), unit.first);
    }
    return units;
}
