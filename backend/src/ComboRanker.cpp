#include "ComboRanker.hpp"

#include <algorithm>
#include <map>

bool ComboRanker::ranks_before(const Combo& a, const Combo& b) {
    if (a.coverage != b.coverage) return a.coverage > b.coverage;
    if (a.score != b.score) return a.score > b.score;
    if (a.words.size() != b.words.size()) return a.words.size() < b.words.size();
    return a.words < b.words;
}

std::vector<Combo> ComboRanker::rank(std::vector<Combo> drafts, size_t max_results) const {
    std::map<std::vector<std::string>, Combo> best;
    for (auto& draft : drafts) {
        auto it = best.find(draft.words);
        if (it == best.end()) {
            best.emplace(draft.words, std::move(draft));
        } else if (ranks_before(draft, it->second)) {
            it->second = std::move(draft);
        }
    }

    std::vector<Combo> ranked;
    ranked.reserve(best.size());
    for (auto& pair : best) ranked.push_back(std::move(pair.second));

    // Partial sort when only the head is needed
    if (ranked.size() > max_results) {
        std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(max_results),
                          ranked.end(), ranks_before);
        ranked.resize(max_results);
    } else {
        std::sort(ranked.begin(), ranked.end(), ranks_before);
    }
    return ranked;
}
