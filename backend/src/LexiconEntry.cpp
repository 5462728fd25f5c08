#include "LexiconEntry.hpp"
#include "ComboErrors.hpp"
#include "InitialsCodec.hpp"

#include <algorithm>
#include <cmath>

LexiconEntry::LexiconEntry(std::string word,
                           std::vector<std::string> initials,
                           double score,
                           std::vector<std::string> sources)
    : word_(std::move(word)),
      initials_(std::move(initials)),
      score_(score),
      sources_(std::move(sources)) {
    if (word_.empty()) {
        throw InvalidParameterError("entry word must not be empty");
    }
    if (initials_.empty()) {
        throw InvalidParameterError("entry '" + word_ + "' has no initials");
    }
    for (const auto& unit : initials_) {
        if (unit.empty()) throw InvalidParameterError("entry '" + word_ + "' has an empty initial-unit");
    }
    if (!std::isfinite(score_) || score_ < 0.0) {
        throw InvalidParameterError("entry '" + word_ + "' has a negative or non-finite score");
    }

    sources_.erase(std::remove(sources_.begin(), sources_.end(), std::string()), sources_.end());
    if (sources_.empty()) {
        throw InvalidParameterError("entry '" + word_ + "' has no source");
    }
    std::sort(sources_.begin(), sources_.end());
    sources_.erase(std::unique(sources_.begin(), sources_.end()), sources_.end());
}

LexiconEntry LexiconEntry::from_word(const std::string& word,
                                     double score,
                                     std::vector<std::string> sources,
                                     const InitialsCodec& codec) {
    return LexiconEntry(word, codec.initials_of(word), score, std::move(sources));
}

bool LexiconEntry::has_source(const std::string& source) const {
    return std::binary_search(sources_.begin(), sources_.end(), source);
}

bool entry_ranks_before(const LexiconEntry& a, const LexiconEntry& b) {
    if (a.score() != b.score()) return a.score() > b.score();
    return a.word() < b.word();
}
