#pragma once
// ComboRanker.hpp
// Orders, deduplicates and truncates the draft combos produced by a search
// Order: coverage desc, score desc, fewer words first, then word sequence

#include <cstddef>
#include <vector>
#include "ComboSearch.hpp"

class ComboRanker {
public:
    // Strict total order over combos with distinct word sequences
    static bool ranks_before(const Combo& a, const Combo& b);

    // Drafts sharing the same word sequence keep their best ranked copy
    std::vector<Combo> rank(std::vector<Combo> drafts, size_t max_results) const;
};
