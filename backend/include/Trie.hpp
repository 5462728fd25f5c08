#pragma once
// Trie.hpp
// Prefix tree keyed by initial-unit (one level per unit, not per byte)
// Every node keeps the ids of the entries whose initials equal the path to that node
// Ids are handed out in rank order by LexiconIndex, so a sorted id list is a ranked list

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

class TrieNode {
public:
    std::map<std::string, std::unique_ptr<TrieNode>> children;
    std::vector<size_t> entry_ids;  // entries ending exactly here, ascending

    TrieNode() = default;
};

class Trie {
public:
    Trie();
    ~Trie();

    // Insert an entry id under its initials path
    void insert(const std::vector<std::string>& initials, size_t entry_id);

    // Node for the whole path, nullptr when it does not exist
    const TrieNode* find(const std::vector<std::string>& units) const;

    // All entry ids at or below a node, ascending (= rank order)
    std::vector<size_t> collect(const TrieNode* node) const;

    const TrieNode* root() const { return root_.get(); }

    // Check if the trie is empty
    bool empty() const;
    size_t node_count() const { return node_count_; }

private:
    std::unique_ptr<TrieNode> root_;
    size_t node_count_ = 1;

    // Helper function to collect all ids from a subtree
    void collect_ids(const TrieNode* node, std::vector<size_t>& results) const;
};
