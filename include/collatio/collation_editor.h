#pragma once

#include "types.h"

#include <pugixml.hpp>

#include <string>
#include <vector>

namespace collatio {

class CollationEditor {
public:
    void set_debug(bool debug) { debug_ = debug; }

    // Every reading whose <divGen type="seg"/> count differs from its lemma's.
    std::vector<SegmentMismatch> validate(const pugi::xml_document& doc) const;

    // Witness ids of the document's listWit, in order.
    std::vector<std::string> get_witnesses(const pugi::xml_document& doc) const;

    // Copy of `doc` where every body-level app is replaced by its lem content.
    void get_lemma_xml(const pugi::xml_document& doc, pugi::xml_document& out) const;

    // Copy of `doc` where every body-level app is replaced by the reading citing `witness`.
    void get_witness_xml(const pugi::xml_document& doc, const std::string& witness,
                         pugi::xml_document& out) const;

    // Rebuilds the apparatus at the granularity of the seg markers; throws ResegmentationMismatch.
    void update_boundaries(const pugi::xml_document& in, pugi::xml_document& out) const;

private:
    bool debug_ = false;
};

} // namespace collatio
