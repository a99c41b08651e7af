#pragma once

#include <string>
#include <vector>

namespace collatio {

// Unit exchanged with the alignment engine: formatted (t) and normalized (n) forms.
struct Token {
    std::string t;
    std::string n;
};

using TokenList = std::vector<Token>;

struct DivisionTokens {
    std::string n;  // index of the division marker that opened the unit
    TokenList tokens;
};

struct Witness {
    std::string id;
    std::vector<DivisionTokens> divisions;  // in document order

    bool extant_at(const std::string& division) const;
    const TokenList* tokens_for(const std::string& division) const;
};

enum class ApparatusType {
    Vocalic,
    Orthographic,
    Transposition,
    Addition,
    Omission,
    Substitution
};

std::string to_string(ApparatusType type);

// One reading whose segment-marker count disagrees with its lemma.
struct SegmentMismatch {
    std::string app;        // apparatus n or xml:id, empty if it has neither
    std::string witnesses;  // wit attribute of the offending reading
    std::size_t lemma_count = 0;
    std::size_t reading_count = 0;

    std::string describe() const;
};

// Placeholder token for a unit a witness leaves empty.
inline Token omission_token() {
    return Token{"", "omit"};
}

} // namespace collatio
