#include "ComboScorer.hpp"
#include "ComboErrors.hpp"

#include <cmath>

ComboScorer::ComboScorer()
    : length_bonus_(0.3),
      segment_penalty_(0.2) {
}

void ComboScorer::set_weights(double length_bonus, double segment_penalty) {
    if (!(length_bonus >= 0.0) || !(segment_penalty >= 0.0) ||
        !std::isfinite(length_bonus) || !std::isfinite(segment_penalty)) {
        throw InvalidParameterError("scoring weights must be finite and non-negative");
    }
    length_bonus_ = length_bonus;
    segment_penalty_ = segment_penalty;
}

void ComboScorer::get_weights(double& length_bonus, double& segment_penalty) const {
    length_bonus = length_bonus_;
    segment_penalty = segment_penalty_;
}

double ComboScorer::word_score(const LexiconEntry& entry) const {
    // 결 -> base, 결근 -> base + 0.3, 결근신 -> base + 0.6
    size_t extra = entry.length() > 0 ? entry.length() - 1 : 0;
    return entry.score() + length_bonus_ * static_cast<double>(extra);
}

double ComboScorer::combo_score(double cumulative, size_t word_count) const {
    if (word_count == 0) return 0.0;
    double n = static_cast<double>(word_count);
    return cumulative / n - segment_penalty_ * (n - 1.0);
}
