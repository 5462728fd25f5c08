#pragma once
// InitialsCodec.hpp
// Derives the initial-unit sequence of a word ("결근" -> ["결","근"]).
// Pure functions of the input, no state besides the configured granularity.

#include <string>
#include <vector>

enum class InitialGranularity {
    Syllable,   // every Hangul syllable is one unit (default)
    Consonant   // only the leading consonant of each syllable (결 -> ㄱ)
};

const char* to_string(InitialGranularity granularity);
bool parse_granularity(const std::string& text, InitialGranularity& out);

class InitialsCodec {
public:
    explicit InitialsCodec(InitialGranularity granularity = InitialGranularity::Syllable);

    // One unit per syllable of the word, whitespace skipped.
    // Throws UnsupportedCharacterError for anything that is not a Hangul syllable
    std::vector<std::string> initials_of(const std::string& word) const;

    // First unit of each word, used to derive a target from example words.
    // Throws UnsupportedCharacterError when a word has no Hangul syllable at all
    std::vector<std::string> initials_from_words(const std::vector<std::string>& words) const;

    // NFC + trim of a user supplied unit
    std::string normalize_unit(const std::string& unit) const;

    InitialGranularity granularity() const { return granularity_; }

private:
    InitialGranularity granularity_;

    std::string unit_for(char32_t syllable) const;
};
