#include "InitialsCodec.hpp"
#include "ComboErrors.hpp"
#include "HangulText.hpp"

#include <cstdio>

namespace {

std::string describe(char32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
    return buf;
}

} // namespace

const char* to_string(InitialGranularity granularity) {
    return granularity == InitialGranularity::Consonant ? "consonant" : "syllable";
}

bool parse_granularity(const std::string& text, InitialGranularity& out) {
    if (text == "syllable") {
        out = InitialGranularity::Syllable;
        return true;
    }
    if (text == "consonant") {
        out = InitialGranularity::Consonant;
        return true;
    }
    return false;
}

InitialsCodec::InitialsCodec(InitialGranularity granularity) : granularity_(granularity) {}

std::string InitialsCodec::unit_for(char32_t syllable) const {
    if (granularity_ == InitialGranularity::Consonant) {
        return hangul::to_utf8(hangul::leading_consonant(syllable));
    }
    return hangul::to_utf8(syllable);
}

std::vector<std::string> InitialsCodec::initials_of(const std::string& word) const {
    std::vector<std::string> units;
    for (char32_t cp : hangul::to_code_points(hangul::nfc(word))) {
        if (hangul::is_whitespace(cp)) continue;
        if (!hangul::is_syllable(cp)) {
            throw UnsupportedCharacterError(
                "cannot derive an initial from " + describe(cp) + " in '" + word + "'", cp);
        }
        units.push_back(unit_for(cp));
    }
    return units;
}

std::vector<std::string> InitialsCodec::initials_from_words(const std::vector<std::string>& words) const {
    std::vector<std::string> units;
    units.reserve(words.size());

    for (const auto& word : words) {
        bool found = false;
        char32_t first_seen = 0;
        for (char32_t cp : hangul::to_code_points(hangul::nfc(word))) {
            if (hangul::is_whitespace(cp)) continue;
            if (first_seen == 0) first_seen = cp;
            if (hangul::is_syllable(cp)) {
                units.push_back(unit_for(cp));
                found = true;
                break;
            }
        }
        if (!found) {
            throw UnsupportedCharacterError("no Hangul syllable in '" + word + "'", first_seen);
        }
    }
    return units;
}

std::string InitialsCodec::normalize_unit(const std::string& unit) const {
    std::vector<char32_t> cps = hangul::to_code_points(hangul::nfc(unit));
    size_t begin = 0;
    size_t end = cps.size();
    while (begin < end && hangul::is_whitespace(cps[begin])) ++begin;
    while (end > begin && hangul::is_whitespace(cps[end - 1])) --end;

    std::string out;
    for (size_t i = begin; i < end; ++i) out += hangul::to_utf8(cps[i]);
    return out;
}
