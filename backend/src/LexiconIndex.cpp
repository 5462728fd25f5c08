#include "LexiconIndex.hpp"
#include "ComboErrors.hpp"
#include "EntryStore.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace {

struct MergedWord {
    std::vector<std::string> initials;
    double score = 0.0;
    std::map<std::string, double> source_scores;
};

} // namespace

const char* to_string(ReconcilePolicy policy) {
    return policy == ReconcilePolicy::RejectConflicts ? "reject" : "max";
}

bool parse_reconcile_policy(const std::string& text, ReconcilePolicy& out) {
    if (text == "max") {
        out = ReconcilePolicy::KeepMax;
        return true;
    }
    if (text == "reject") {
        out = ReconcilePolicy::RejectConflicts;
        return true;
    }
    return false;
}

LexiconIndex::LexiconIndex(std::vector<LexiconEntry> entries, InitialsCodec codec)
    : entries_(std::move(entries)), codec_(codec) {
    word_to_id_.reserve(entries_.size());
    for (size_t id = 0; id < entries_.size(); ++id) {
        word_to_id_.emplace(entries_[id].word(), id);
        trie_.insert(entries_[id].initials(), id);
    }
}

std::shared_ptr<const LexiconIndex> LexiconIndex::build(const std::vector<LexiconEntry>& entries,
                                                        ReconcilePolicy policy,
                                                        InitialsCodec codec) {
    std::map<std::string, MergedWord> registry;

    for (const auto& entry : entries) {
        auto inserted = registry.emplace(entry.word(), MergedWord());
        MergedWord& merged = inserted.first->second;

        if (inserted.second || entry.score() > merged.score) {
            merged.score = entry.score();
            merged.initials = entry.initials();
        }

        for (const auto& source : entry.sources()) {
            auto it = merged.source_scores.find(source);
            if (it == merged.source_scores.end()) {
                merged.source_scores.emplace(source, entry.score());
            } else if (it->second != entry.score()) {
                if (policy == ReconcilePolicy::RejectConflicts) {
                    throw DuplicateSourceConflictError(entry.word(), source);
                }
                it->second = std::max(it->second, entry.score());
            }
        }
    }

    std::vector<LexiconEntry> reconciled;
    reconciled.reserve(registry.size());
    for (auto& pair : registry) {
        std::vector<std::string> sources;
        sources.reserve(pair.second.source_scores.size());
        for (const auto& s : pair.second.source_scores) sources.push_back(s.first);
        reconciled.emplace_back(pair.first, std::move(pair.second.initials), pair.second.score, std::move(sources));
    }
    std::sort(reconciled.begin(), reconciled.end(), entry_ranks_before);

    return std::shared_ptr<const LexiconIndex>(new LexiconIndex(std::move(reconciled), codec));
}

std::shared_ptr<const LexiconIndex> LexiconIndex::load_from_jsonl(const std::string& path,
                                                                  const std::map<std::string, double>& source_weights,
                                                                  ReconcilePolicy policy,
                                                                  InitialsCodec codec) {
    EntryStore store;
    store.set_source_weights(source_weights);
    if (!store.load_from_jsonl(path, codec)) {
        throw std::runtime_error("no lexicon entries could be loaded from " + path);
    }

    auto index = build(store.entries(), policy, codec);
    std::cout << "[Index] Lexicon ready: " << index->size() << " words, "
              << index->node_count() << " trie nodes (" << to_string(codec.granularity()) << " initials)\n";
    return index;
}

bool LexiconIndex::save_to_jsonl(const std::string& path) const {
    return EntryStore::save_to_jsonl(path, entries_);
}

std::vector<const LexiconEntry*> LexiconIndex::lookup_prefix(const std::vector<std::string>& prefix, size_t limit) const {
    std::vector<const LexiconEntry*> results;
    const TrieNode* node = trie_.find(prefix);
    if (node == nullptr) return results;

    std::vector<size_t> ids = trie_.collect(node);
    if (limit > 0 && ids.size() > limit) ids.resize(limit);

    results.reserve(ids.size());
    for (size_t id : ids) results.push_back(&entries_[id]);
    return results;
}

std::vector<const LexiconEntry*> LexiconIndex::lookup_exact(const std::vector<std::string>& initials) const {
    std::vector<const LexiconEntry*> results;
    if (initials.empty()) return results;

    const TrieNode* node = trie_.find(initials);
    if (node == nullptr) return results;

    results.reserve(node->entry_ids.size());
    for (size_t id : node->entry_ids) results.push_back(&entries_[id]);
    return results;
}

const LexiconEntry* LexiconIndex::find(const std::string& word) const {
    auto it = word_to_id_.find(word);
    return it == word_to_id_.end() ? nullptr : &entries_[it->second];
}

bool LexiconIndex::contains(const std::string& word) const {
    return find(word) != nullptr;
}

std::optional<double> LexiconIndex::score_of(const std::string& word) const {
    const LexiconEntry* entry = find(word);
    if (entry == nullptr) return std::nullopt;
    return entry->score();
}

bool LexiconIndex::has_prefix(const std::vector<std::string>& prefix) const {
    const TrieNode* node = trie_.find(prefix);
    if (node == nullptr) return false;
    // Every non-root node lies on the path of at least one entry
    return node != trie_.root() || !trie_.empty();
}

bool LexiconIndex::has_word_prefix(const std::string& text) const {
    std::vector<std::string> initials = codec_.initials_of(text);
    if (initials.empty()) return false;

    const TrieNode* node = trie_.find(initials);
    if (node == nullptr) return false;

    for (size_t id : trie_.collect(node)) {
        if (entries_[id].word().compare(0, text.size(), text) == 0) return true;
    }
    return false;
}

std::vector<const LexiconEntry*> LexiconIndex::words_starting_with(const std::string& unit, size_t limit) const {
    return lookup_prefix(std::vector<std::string>{unit}, limit);
}

void LexiconIndex::append_node(const TrieNode* node, size_t per_node_limit, std::vector<const LexiconEntry*>& out) const {
    size_t count = std::min(per_node_limit, node->entry_ids.size());
    for (size_t i = 0; i < count; ++i) {
        out.push_back(&entries_[node->entry_ids[i]]);
    }
}

std::vector<const LexiconEntry*> LexiconIndex::matches_along(const std::vector<std::string>& units,
                                                             size_t offset,
                                                             size_t per_node_limit) const {
    std::vector<const LexiconEntry*> out;
    const TrieNode* current = trie_.root();

    for (size_t i = offset; i < units.size(); ++i) {
        auto it = current->children.find(units[i]);
        if (it == current->children.end()) break;
        current = it->second.get();
        append_node(current, per_node_limit, out);
    }
    return out;
}

std::vector<const LexiconEntry*> LexiconIndex::matches_within(const std::map<std::string, int>& bag,
                                                              size_t per_node_limit) const {
    std::vector<const LexiconEntry*> out;
    std::map<std::string, int> remaining = bag;
    visit_within(trie_.root(), remaining, per_node_limit, out);
    return out;
}

void LexiconIndex::visit_within(const TrieNode* node,
                                std::map<std::string, int>& bag,
                                size_t per_node_limit,
                                std::vector<const LexiconEntry*>& out) const {
    for (auto& unit : bag) {
        if (unit.second <= 0) continue;
        auto it = node->children.find(unit.first);
        if (it == node->children.end()) continue;

        --unit.second;
        append_node(it->second.get(), per_node_limit, out);
        visit_within(it->second.get(), bag, per_node_limit, out);
        ++unit.second;
    }
}
