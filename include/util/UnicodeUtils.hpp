#pragma once

#include <string>
#include <unicode/unistr.h>
#include <unicode/normalizer2.h>
#include <unicode/locid.h>

namespace cadenza::util {

/// Canonical composition (NFC): "e" + U+0301 becomes "é".
/// Returns the input unchanged if ICU cannot load its normalization data.
inline std::string compose_nfc(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || !nfc) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    icu::UnicodeString composed = nfc->normalize(unicode_text, status);
    if (U_FAILURE(status)) {
        return text;
    }

    std::string result;
    composed.toUTF8String(result);
    return result;
}

/// Canonical decomposition (NFD), the form HFS+ reports file names in
inline std::string decompose_nfd(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status) || !nfd) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    icu::UnicodeString decomposed = nfd->normalize(unicode_text, status);
    if (U_FAILURE(status)) {
        return text;
    }

    std::string result;
    decomposed.toUTF8String(result);
    return result;
}

/// Locale-independent Unicode lowercase (root locale, so "I" never becomes dotless)
inline std::string to_lower(const std::string& text) {
    if (text.empty()) {
        return text;
    }
    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    unicode_text.toLower(icu::Locale::getRoot());

    std::string result;
    unicode_text.toUTF8String(result);
    return result;
}

} // namespace cadenza::util
