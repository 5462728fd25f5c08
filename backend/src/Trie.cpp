#include "Trie.hpp"
#include <algorithm>

Trie::Trie() : root_(std::make_unique<TrieNode>()) {}

Trie::~Trie() = default;

void Trie::insert(const std::vector<std::string>& initials, size_t entry_id) {
    if (initials.empty()) return;

    TrieNode* current = root_.get();

    // Traverse/create path for each initial-unit
    for (const auto& unit : initials) {
        auto& child = current->children[unit];
        if (!child) {
            child = std::make_unique<TrieNode>();
            ++node_count_;
        }
        current = child.get();
    }

    auto pos = std::lower_bound(current->entry_ids.begin(), current->entry_ids.end(), entry_id);
    if (pos == current->entry_ids.end() || *pos != entry_id) {
        current->entry_ids.insert(pos, entry_id);
    }
}

const TrieNode* Trie::find(const std::vector<std::string>& units) const {
    const TrieNode* current = root_.get();
    for (const auto& unit : units) {
        auto it = current->children.find(unit);
        if (it == current->children.end()) {
            return nullptr;
        }
        current = it->second.get();
    }
    return current;
}

std::vector<size_t> Trie::collect(const TrieNode* node) const {
    std::vector<size_t> results;
    if (node == nullptr) return results;
    collect_ids(node, results);
    std::sort(results.begin(), results.end());
    return results;
}

bool Trie::empty() const {
    return root_->children.empty();
}

void Trie::collect_ids(const TrieNode* node, std::vector<size_t>& results) const {
    results.insert(results.end(), node->entry_ids.begin(), node->entry_ids.end());
    for (const auto& pair : node->children) {
        collect_ids(pair.second.get(), results);
    }
}
