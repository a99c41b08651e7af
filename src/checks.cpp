#include "collatio/checks.h"
#include "collatio/normalizer.h"
#include "collatio/unicode_utils.h"
#include "collatio/xml_utils.h"

namespace collatio {

namespace {

constexpr UChar32 kVav = 0x05D5;
constexpr UChar32 kHolamHaserForVav = 0x05BA;

template <typename Predicate>
std::vector<Finding> scan_words(const pugi::xml_document& doc, Predicate flagged) {
    std::vector<Finding> findings;
    std::string division;
    for (const auto& child : xml::element_children(xml::require_body(doc))) {
        if (xml::is_division_marker(child)) {
            if (child.attribute("n")) {
                division = child.attribute("n").value();
            }
            continue;
        }
        if (!xml::is_element(child, "w")) {
            continue;
        }
        std::string word = xml::element_text(child);
        if (flagged(word)) {
            findings.push_back(Finding{word, division});
        }
    }
    return findings;
}

} // namespace

std::vector<Finding> find_unpointed_words(const pugi::xml_document& doc) {
    Normalizer stripped(NormalizerConfig::fully_stripped());
    return scan_words(doc, [&stripped](const std::string& word) {
        return stripped.format_text(word) == unicode::to_nfc(word);
    });
}

std::vector<Finding> find_invalid_holam(const pugi::xml_document& doc) {
    return scan_words(doc, [](const std::string& word) {
        icu::UnicodeString ustr = unicode::to_unicode_string(word);
        UChar32 previous = 0;
        int32_t i = 0;
        while (i < ustr.length()) {
            UChar32 c = ustr.char32At(i);
            if (c == kHolamHaserForVav && i > 0 && previous != kVav) {
                return true;
            }
            previous = c;
            i += U16_LENGTH(c);
        }
        return false;
    });
}

} // namespace collatio
