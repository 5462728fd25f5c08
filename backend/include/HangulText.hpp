#pragma once
// HangulText.hpp
// Small Unicode helpers for Korean headwords, built on ICU.
// Converts between UTF-8 and code points, applies NFC and extracts leading consonants.

#include <string>
#include <vector>

namespace hangul {

constexpr char32_t kSyllableFirst = 0xAC00;  // 가
constexpr char32_t kSyllableLast = 0xD7A3;   // 힣

// Decode a UTF-8 string into code points (invalid sequences become U+FFFD)
std::vector<char32_t> to_code_points(const std::string& utf8);

// Encode a single code point as UTF-8
std::string to_utf8(char32_t code_point);

// Canonical composition (NFC). Throws std::runtime_error if ICU cannot provide the normalizer
std::string nfc(const std::string& utf8);

bool is_syllable(char32_t code_point);
bool is_whitespace(char32_t code_point);

// Compatibility jamo of the leading consonant of a precomposed syllable (결 -> ㄱ)
char32_t leading_consonant(char32_t syllable);

// Strip zero-width marks and soft hyphens, collapse whitespace, apply NFC,
// drop trailing homograph numbers (단어01) and keep Hangul syllables only
std::string normalize_word(const std::string& raw);

// Number of code points in a UTF-8 string
size_t length(const std::string& utf8);

} // namespace hangul
