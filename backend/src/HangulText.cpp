#include "HangulText.hpp"

#include <stdexcept>

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace hangul {

namespace {

// Compatibility jamo for the 19 leading consonants, in Unicode choseong order
const char32_t kLeadingJamo[19] = {
    0x3131, 0x3132, 0x3134, 0x3137, 0x3138, 0x3139, 0x3141, 0x3142, 0x3143, 0x3145,
    0x3146, 0x3147, 0x3148, 0x3149, 0x314A, 0x314B, 0x314C, 0x314D, 0x314E
};

// 21 medial vowels * 28 trailing consonants
constexpr char32_t kSyllablesPerLead = 588;

bool is_invisible(char32_t cp) {
    return cp == 0xFEFF || cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0x2060 || cp == 0x00AD;
}

bool is_ascii_digit(char32_t cp) {
    return cp >= U'0' && cp <= U'9';
}

} // namespace

std::vector<char32_t> to_code_points(const std::string& utf8) {
    std::vector<char32_t> out;
    icu::UnicodeString text = icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    out.reserve(static_cast<size_t>(text.length()));

    int32_t i = 0;
    while (i < text.length()) {
        UChar32 c = text.char32At(i);
        out.push_back(static_cast<char32_t>(c));
        i = text.moveIndex32(i, 1);
    }
    return out;
}

std::string to_utf8(char32_t code_point) {
    std::string out;
    icu::UnicodeString(static_cast<UChar32>(code_point)).toUTF8String(out);
    return out;
}

std::string nfc(const std::string& utf8) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || normalizer == nullptr) {
        throw std::runtime_error(std::string("NFC normalizer unavailable: ") + u_errorName(status));
    }

    icu::UnicodeString source = icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    icu::UnicodeString composed = normalizer->normalize(source, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFC normalization failed: ") + u_errorName(status));
    }

    std::string out;
    composed.toUTF8String(out);
    return out;
}

bool is_syllable(char32_t code_point) {
    return code_point >= kSyllableFirst && code_point <= kSyllableLast;
}

bool is_whitespace(char32_t code_point) {
    return u_isUWhiteSpace(static_cast<UChar32>(code_point)) != 0;
}

char32_t leading_consonant(char32_t syllable) {
    if (!is_syllable(syllable)) return 0;
    return kLeadingJamo[(syllable - kSyllableFirst) / kSyllablesPerLead];
}

std::string normalize_word(const std::string& raw) {
    // Remove invisible marks before composing so they cannot split a syllable
    std::string visible;
    visible.reserve(raw.size());
    for (char32_t cp : to_code_points(raw)) {
        if (!is_invisible(cp)) visible += to_utf8(cp);
    }

    std::vector<char32_t> cps = to_code_points(nfc(visible));

    // Trailing homograph numbers (사과01 -> 사과)
    while (!cps.empty() && (is_ascii_digit(cps.back()) || is_whitespace(cps.back()))) {
        cps.pop_back();
    }

    std::string out;
    out.reserve(cps.size() * 3);
    for (char32_t cp : cps) {
        if (is_syllable(cp)) out += to_utf8(cp);
    }
    return out;
}

size_t length(const std::string& utf8) {
    return to_code_points(utf8).size();
}

} // namespace hangul
