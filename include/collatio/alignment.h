#pragma once

#include "types.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace collatio {

// Multi-witness aligner producing a TEI apparatus fragment for one division.
class AlignmentEngine {
public:
    virtual ~AlignmentEngine() = default;

    // `request` is {"witnesses":[{"id":..,"tokens":[{"t":..,"n":..}]}]}.
    virtual std::string align(const std::string& division, const nlohmann::json& request) = 0;
};

// Replays engine output recorded per division ({"<division n>": "<TEI>", ...}).
class RecordedAlignment : public AlignmentEngine {
public:
    explicit RecordedAlignment(nlohmann::json outputs);

    static std::unique_ptr<RecordedAlignment> load(const std::string& path);

    std::string align(const std::string& division, const nlohmann::json& request) override;

private:
    nlohmann::json outputs_;
};

// Interchange request for the witnesses extant at `division`.
nlohmann::json alignment_request(const std::vector<Witness>& witnesses, const std::string& division);

// Undoes the escaping of <, > and " that engines apply to token markup.
std::string unescape_markup(const std::string& text);

} // namespace collatio
