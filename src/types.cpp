#include "collatio/types.h"
#include "collatio/errors.h"

#include <sstream>
#include <utility>

namespace collatio {

bool Witness::extant_at(const std::string& division) const {
    return tokens_for(division) != nullptr;
}

const TokenList* Witness::tokens_for(const std::string& division) const {
    for (const auto& unit : divisions) {
        if (unit.n == division) {
            return &unit.tokens;
        }
    }
    return nullptr;
}

std::string to_string(ApparatusType type) {
    switch (type) {
        case ApparatusType::Vocalic:
            return "vocalic";
        case ApparatusType::Orthographic:
            return "orthographic";
        case ApparatusType::Transposition:
            return "transposition";
        case ApparatusType::Addition:
            return "addition";
        case ApparatusType::Omission:
            return "omission";
        case ApparatusType::Substitution:
            return "substitution";
    }
    return "substitution";
}

std::string SegmentMismatch::describe() const {
    std::ostringstream out;
    out << "The apparatus";
    if (!app.empty()) {
        out << " with index " << app;
    }
    out << " has a reading";
    if (!witnesses.empty()) {
        out << " (" << witnesses << ")";
    }
    out << " with " << reading_count << " segment markers where the lemma has " << lemma_count;
    return out.str();
}

namespace {

std::string summarize(const std::vector<SegmentMismatch>& mismatches) {
    std::ostringstream out;
    out << "Resegmentation is not valid: " << mismatches.size() << " mismatched reading";
    if (mismatches.size() != 1) {
        out << "s";
    }
    for (const auto& mismatch : mismatches) {
        out << "\n  " << mismatch.describe();
    }
    return out.str();
}

} // namespace

ResegmentationMismatch::ResegmentationMismatch(std::vector<SegmentMismatch> mismatches)
    : Error(summarize(mismatches)), mismatches_(std::move(mismatches)) {}

} // namespace collatio
