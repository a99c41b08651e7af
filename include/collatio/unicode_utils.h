#pragma once

#include <unicode/normalizer2.h>
#include <unicode/uniset.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/utypes.h>

#include <stdexcept>
#include <string>

namespace collatio {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), static_cast<int32_t>(utf8_str.length())));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

inline void check_status(UErrorCode status, const char* what) {
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string(what) + ": " + u_errorName(status));
    }
}

/**
 * Canonical decomposition (NFD)
 */
inline icu::UnicodeString decompose(const icu::UnicodeString& ustr) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
    check_status(status, "NFD normalizer unavailable");
    icu::UnicodeString result = nfd->normalize(ustr, status);
    check_status(status, "NFD normalization failed");
    return result;
}

/**
 * Canonical composition (NFC)
 */
inline icu::UnicodeString compose(const icu::UnicodeString& ustr) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    check_status(status, "NFC normalizer unavailable");
    icu::UnicodeString result = nfc->normalize(ustr, status);
    check_status(status, "NFC normalization failed");
    return result;
}

inline std::string to_nfc(const std::string& utf8_str) {
    return from_unicode_string(compose(to_unicode_string(utf8_str)));
}

/**
 * Build a frozen set from an ICU pattern such as "[\\u05C4-\\u05C5]"
 */
inline icu::UnicodeSet make_set(const char* pattern) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeSet set(icu::UnicodeString(pattern, -1, US_INV), status);
    check_status(status, "Invalid character class pattern");
    set.freeze();
    return set;
}

/**
 * Drop every code point contained in the set
 */
inline icu::UnicodeString remove_all(const icu::UnicodeString& ustr, const icu::UnicodeSet& set) {
    icu::UnicodeString result;
    int32_t i = 0;
    while (i < ustr.length()) {
        UChar32 c = ustr.char32At(i);
        if (!set.contains(c)) {
            result.append(c);
        }
        i += U16_LENGTH(c);
    }
    return result;
}

/**
 * Parse a hexadecimal code point ("05C0", "U+05C0") to its UTF-8 encoding
 */
inline std::string code_point_from_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.rfind("U+", 0) == 0 || digits.rfind("u+", 0) == 0) {
        digits = digits.substr(2);
    }
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(digits, &used, 16);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid code point: " + hex);
    }
    if (used != digits.size() || value > 0x10FFFF) {
        throw std::runtime_error("Invalid code point: " + hex);
    }
    icu::UnicodeString ustr;
    ustr.append(static_cast<UChar32>(value));
    return from_unicode_string(ustr);
}

}  // namespace unicode
}  // namespace collatio
