#include "collatio/plene.h"
#include "collatio/normalizer.h"
#include "collatio/unicode_utils.h"

#include <unicode/uchar.h>

namespace collatio {

namespace {

constexpr char32_t kAlef = 0x05D0;
constexpr char32_t kVav = 0x05D5;
constexpr char32_t kYod = 0x05D9;
constexpr char32_t kSheva = 0x05B0;
constexpr char32_t kHiriq = 0x05B4;
constexpr char32_t kTsere = 0x05B5;
constexpr char32_t kSegol = 0x05B6;
constexpr char32_t kQubuts = 0x05BB;
constexpr char32_t kHolam = 0x05B9;
constexpr char32_t kDagesh = 0x05BC;

enum class ClusterKind { Space, Letter, Other };

struct Cluster {
    ClusterKind kind;
    char32_t base;
    std::u32string points;
};

bool is_hebrew_letter(char32_t c) {
    return c >= 0x05D0 && c <= 0x05EA;
}

std::u32string to_code_points(const icu::UnicodeString& ustr) {
    std::u32string result;
    int32_t i = 0;
    while (i < ustr.length()) {
        UChar32 c = ustr.char32At(i);
        result.push_back(static_cast<char32_t>(c));
        i += U16_LENGTH(c);
    }
    return result;
}

// Decomposed letters with their points; accents are dropped, other characters kept as they are.
std::vector<Cluster> clusterize(const std::string& text) {
    const icu::UnicodeSet& pointing = accent_class_set("pointing");
    const icu::UnicodeSet& cantillation = accent_class_set("cantillation");
    const icu::UnicodeSet& extraordinaire = accent_class_set("extraordinaire");

    std::vector<Cluster> clusters;
    for (char32_t c : to_code_points(unicode::decompose(unicode::to_unicode_string(text)))) {
        UChar32 cp = static_cast<UChar32>(c);
        if (cantillation.contains(cp) || extraordinaire.contains(cp)) {
            continue;
        }
        if (u_isUWhiteSpace(cp)) {
            clusters.push_back(Cluster{ClusterKind::Space, U' ', U""});
        } else if (is_hebrew_letter(c)) {
            clusters.push_back(Cluster{ClusterKind::Letter, c, U""});
        } else if (pointing.contains(cp) && !clusters.empty() && clusters.back().kind == ClusterKind::Letter) {
            clusters.back().points.push_back(c);
        } else {
            clusters.push_back(Cluster{ClusterKind::Other, c, U""});
        }
    }
    return clusters;
}

std::string to_utf8(const std::vector<Cluster>& clusters, const std::vector<bool>& dropped) {
    icu::UnicodeString out;
    for (std::size_t i = 0; i < clusters.size(); ++i) {
        if (dropped[i]) {
            continue;
        }
        out.append(static_cast<UChar32>(clusters[i].base));
        for (char32_t point : clusters[i].points) {
            out.append(static_cast<UChar32>(point));
        }
    }
    return unicode::from_unicode_string(unicode::compose(out));
}

bool is_space(const std::vector<Cluster>& clusters, std::size_t i) {
    return clusters[i].kind == ClusterKind::Space;
}

bool carries_any(const std::u32string& points, const std::u32string& wanted) {
    for (char32_t point : wanted) {
        if (points.find(point) != std::u32string::npos) {
            return true;
        }
    }
    return false;
}

bool matches(const PleneRule& rule, const std::vector<Cluster>& clusters, std::size_t i) {
    const Cluster& current = clusters[i];
    if (current.kind != ClusterKind::Letter || current.base != rule.letter || current.points != rule.points) {
        return false;
    }
    const Cluster& previous = clusters[i - 1];
    if (rule.after_letter != 0 &&
        (previous.kind != ClusterKind::Letter || previous.base != rule.after_letter || !previous.points.empty())) {
        return false;
    }
    if (!rule.previous_vowels.empty() && !carries_any(previous.points, rule.previous_vowels)) {
        return false;
    }
    if (rule.drop_previous && (i < 2 || is_space(clusters, i - 2))) {
        return false;
    }
    return true;
}

} // namespace

const std::vector<PleneRule>& plene_rules() {
    static const std::vector<PleneRule> rules = {
        {"silent alef", kAlef, U"", 0, U"", false, 0},
        {"alef-vav digraph", kVav, U"", kAlef, U"", true, kHolam},
        {"holam male", kVav, std::u32string(1, kHolam), 0, U"", false, kHolam},
        {"shureq", kVav, std::u32string(1, kDagesh), 0, U"", false, kQubuts},
        {"yod after i/e vowel", kYod, U"", 0, std::u32string{kHiriq, kTsere, kSegol}, false, 0},
        {"yod with sheva after i/e vowel", kYod, std::u32string(1, kSheva), 0, std::u32string{kHiriq, kTsere, kSegol},
         false, 0},
    };
    return rules;
}

std::string strip_plene(const std::string& text) {
    const std::vector<Cluster> original = clusterize(text);
    std::vector<Cluster> clusters = original;
    std::vector<bool> dropped(clusters.size(), false);

    for (std::size_t i = 0; i < original.size(); ++i) {
        if (is_space(original, i)) {
            continue;
        }
        bool first = i == 0 || is_space(original, i - 1);
        bool last = i + 1 == original.size() || is_space(original, i + 1);
        if (first || last) {
            continue;
        }
        for (const auto& rule : plene_rules()) {
            if (!matches(rule, original, i)) {
                continue;
            }
            dropped[i] = true;
            std::size_t target = i - 1;
            if (rule.drop_previous) {
                dropped[i - 1] = true;
                target = i - 2;
            }
            if (rule.add_to_preceding != 0) {
                // Nearest kept cluster of the same word
                while (target > 0 && dropped[target] && !is_space(original, target - 1)) {
                    --target;
                }
                std::u32string& points = clusters[target].points;
                if (points.find(rule.add_to_preceding) == std::u32string::npos) {
                    points.push_back(rule.add_to_preceding);
                }
            }
            break;
        }
    }
    return to_utf8(clusters, dropped);
}

std::string consonantal_skeleton(const std::string& text) {
    std::vector<Cluster> clusters = clusterize(text);
    std::vector<bool> dropped(clusters.size(), false);
    for (std::size_t i = 0; i < clusters.size(); ++i) {
        clusters[i].points.clear();
        if (clusters[i].kind == ClusterKind::Other && u_charType(static_cast<UChar32>(clusters[i].base)) == U_NON_SPACING_MARK) {
            dropped[i] = true;
        }
    }
    for (std::size_t i = 1; i + 1 < clusters.size(); ++i) {
        const Cluster& c = clusters[i];
        if (c.kind != ClusterKind::Letter || is_space(clusters, i - 1) || is_space(clusters, i + 1)) {
            continue;
        }
        if (c.base == kAlef || c.base == kVav || c.base == kYod) {
            dropped[i] = true;
        }
    }
    return to_utf8(clusters, dropped);
}

} // namespace collatio
