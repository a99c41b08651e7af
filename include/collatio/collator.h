#pragma once

#include "alignment.h"
#include "normalizer.h"
#include "types.h"

#include <nlohmann/json.hpp>
#include <pugixml.hpp>

#include <string>
#include <vector>

namespace collatio {

class Collator {
public:
    // `config` holds the accent classes and tags ignored for collation.
    explicit Collator(NormalizerConfig config, std::string level = "verse");

    void set_debug(bool debug) { debug_ = debug; }

    // Adds the witnesses of one transcription; the first transcription read is the lemma.
    void read_witness(const pugi::xml_document& transcription);

    const std::vector<Witness>& witnesses() const { return witnesses_; }
    const std::string& lemma_witness() const { return lemma_; }
    const pugi::xml_document& lemma_document() const { return lemma_doc_; }
    const pugi::xml_document& collation() const { return collation_; }

    // Division indices of the lemma, in order; only these are collated.
    std::vector<std::string> divisions() const;

    // [{"division": n, "witnesses": [...]}, ...] for every lemma division.
    nlohmann::json export_requests() const;

    // Aligns every lemma division and appends the coverage-complete output to collation().
    void collate(AlignmentEngine& engine);

    // Adds an empty reading for the extant witnesses no reading of `app` cites.
    void complete_coverage(pugi::xml_node app, const std::vector<std::string>& extant) const;

    // Writes listWit and merges the collated apparatus into the lemma document.
    void augment_lemma();

private:
    NormalizerConfig config_;
    std::string level_;
    std::vector<Witness> witnesses_;
    std::string lemma_;
    pugi::xml_document lemma_doc_;
    pugi::xml_document collation_;
    bool debug_ = false;

    void add_witness(const std::string& id, const pugi::xml_document& transcription,
                     const std::string& reading_type);
    std::vector<std::string> extant_at(const std::string& division) const;
};

} // namespace collatio
