#include "collatio/collator.h"
#include "collatio/errors.h"
#include "collatio/segmenter.h"
#include "collatio/tokens.h"
#include "collatio/xml_utils.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace collatio {

namespace {

std::string witness_name(const pugi::xml_document& transcription) {
    std::vector<pugi::xml_node> titles = xml::descendants(transcription, "title");
    if (titles.size() < 2) {
        throw StructuralViolation("Transcription has no witness title (second <title/> element)");
    }
    const pugi::xml_node& title = titles[1];
    std::string name = title.attribute("n") ? title.attribute("n").value() : xml::element_text(title);
    if (name.empty()) {
        throw StructuralViolation("Witness title is empty");
    }
    return name;
}

std::vector<std::string> reading_types(const pugi::xml_document& transcription) {
    std::vector<std::string> types;
    for (const auto& rdg : xml::descendants(transcription, "rdg")) {
        std::string type = rdg.attribute("type").value();
        if (!type.empty() && std::find(types.begin(), types.end(), type) == types.end()) {
            types.push_back(type);
        }
    }
    return types;
}

pugi::xml_node lemma_reading(const pugi::xml_node& app, const std::string& lemma) {
    for (const auto& rdg : xml::element_children(app, "rdg")) {
        if (xml::cites_witness(rdg, lemma)) {
            return rdg;
        }
    }
    throw UnknownWitnessMembership("No reading of a collated apparatus cites the lemma witness " + lemma);
}

std::string wit_list(const std::vector<std::string>& witnesses) {
    std::string wit;
    for (const auto& witness : witnesses) {
        wit += (wit.empty() ? "#" : " #") + witness;
    }
    return wit;
}

} // namespace

Collator::Collator(NormalizerConfig config, std::string level)
    : config_(std::move(config)), level_(std::move(level)) {
    // Rejects conflicting configurations before any transcription is read
    Normalizer validate(config_);
}

void Collator::read_witness(const pugi::xml_document& transcription) {
    std::string primary = witness_name(transcription);
    std::vector<std::string> types = reading_types(transcription);
    if (types.empty()) {
        add_witness(primary, transcription, "");
        return;
    }
    // Each reading tradition of the transcription is collated as its own witness
    for (const auto& type : types) {
        add_witness(primary + "-" + type, transcription, type);
    }
}

void Collator::add_witness(const std::string& id, const pugi::xml_document& transcription,
                           const std::string& reading_type) {
    for (const auto& witness : witnesses_) {
        if (witness.id == id) {
            throw StructuralViolation("Witness " + id + " has already been read");
        }
    }

    if (lemma_.empty()) {
        NormalizerConfig lemma_config;
        lemma_config.preferred_reading = reading_type;
        Normalizer(lemma_config).normalize(transcription, lemma_doc_);
        lemma_ = id;
    }

    // Division markers have to survive normalization to delimit units
    NormalizerConfig formatted_config = config_;
    formatted_config.preferred_reading = reading_type;
    formatted_config.ignored_tags.erase("divGen");
    formatted_config.ignored_tags.erase("milestone");
    NormalizerConfig stripped_config = formatted_config;
    stripped_config.accents = NormalizerConfig::fully_stripped().accents;

    pugi::xml_document formatted;
    pugi::xml_document stripped;
    Normalizer(formatted_config).normalize(transcription, formatted);
    Normalizer(stripped_config).normalize(transcription, stripped);

    Witness witness;
    witness.id = id;
    witness.divisions = extract_division_tokens(formatted, stripped, level_, config_.ignored_tags);
    if (debug_) {
        std::cerr << "[collatio] witness " << id << ": " << witness.divisions.size() << " divisions" << std::endl;
    }
    witnesses_.push_back(std::move(witness));
}

std::vector<std::string> Collator::divisions() const {
    std::vector<std::string> result;
    for (const auto& witness : witnesses_) {
        if (witness.id != lemma_) {
            continue;
        }
        for (const auto& unit : witness.divisions) {
            result.push_back(unit.n);
        }
    }
    return result;
}

std::vector<std::string> Collator::extant_at(const std::string& division) const {
    std::vector<std::string> extant;
    for (const auto& witness : witnesses_) {
        if (witness.extant_at(division)) {
            extant.push_back(witness.id);
        }
    }
    return extant;
}

nlohmann::json Collator::export_requests() const {
    nlohmann::json requests = nlohmann::json::array();
    for (const auto& division : divisions()) {
        nlohmann::json request = alignment_request(witnesses_, division);
        request["division"] = division;
        requests.push_back(request);
    }
    return requests;
}

void Collator::collate(AlignmentEngine& engine) {
    collation_.reset();
    pugi::xml_node root = collation_.append_child("collation");

    for (const auto& division : divisions()) {
        std::string output = unescape_markup(engine.align(division, alignment_request(witnesses_, division)));
        pugi::xml_document fragment;
        pugi::xml_parse_result result = fragment.load_string(output.c_str());
        if (!result) {
            throw StructuralViolation("Alignment output for division " + division + " is not well-formed: " +
                                      result.description());
        }
        pugi::xml_node apparatus = fragment.document_element();
        std::vector<std::string> extant = extant_at(division);
        std::size_t variants = 0;
        for (pugi::xml_node child = apparatus.first_child(); child; child = child.next_sibling()) {
            pugi::xml_node copy = root.append_copy(child);
            if (xml::is_element(copy, "app")) {
                complete_coverage(copy, extant);
                ++variants;
            }
        }
        if (debug_) {
            std::cerr << "[collatio] division " << division << ": " << extant.size() << " witnesses, "
                      << variants << " variation points" << std::endl;
        }
    }
}

void Collator::complete_coverage(pugi::xml_node app, const std::vector<std::string>& extant) const {
    std::set<std::string> covered;
    for (const auto& rdg : xml::element_children(app, "rdg")) {
        for (const auto& ref : xml::witness_references(rdg)) {
            if (std::find(extant.begin(), extant.end(), ref) == extant.end()) {
                throw UnknownWitnessMembership("Reading cites witness " + ref + ", which is not extant here");
            }
            covered.insert(ref);
        }
    }
    std::vector<std::string> uncovered;
    for (const auto& witness : witnesses_) {
        if (covered.count(witness.id) == 0 &&
            std::find(extant.begin(), extant.end(), witness.id) != extant.end()) {
            uncovered.push_back(witness.id);
        }
    }
    if (uncovered.empty()) {
        return;
    }
    std::string name = xml::element_name(app, "rdg");
    bool lemma_omits = std::find(uncovered.begin(), uncovered.end(), lemma_) != uncovered.end();
    pugi::xml_node omission = lemma_omits ? app.prepend_child(name.c_str()) : app.append_child(name.c_str());
    omission.append_attribute("wit") = wit_list(uncovered).c_str();
}

void Collator::augment_lemma() {
    pugi::xml_node source_desc = xml::first_descendant(lemma_doc_, "sourceDesc");
    if (!source_desc) {
        throw StructuralViolation("Lemma transcription has no <sourceDesc/> element");
    }
    pugi::xml_node list = source_desc.append_child(xml::element_name(source_desc, "listWit").c_str());
    for (const auto& witness : witnesses_) {
        pugi::xml_node entry = list.append_child(xml::element_name(source_desc, "witness").c_str());
        entry.append_attribute("xml:id") = witness.id.c_str();
    }

    Segmenter segmenter(config_.ignored_tags);
    pugi::xml_document segmented;
    segmenter.segment(lemma_doc_, segmented);
    pugi::xml_node body = xml::require_body(segmented);

    std::map<std::string, pugi::xml_node> segments_by_key;
    for (const auto& seg : Segmenter::segments(segmented)) {
        std::string key = std::string(seg.attribute("type").value()) + ":" + seg.attribute("n").value();
        segments_by_key[key] = seg;
    }

    // Place each apparatus after the segment of the last substantive element before it
    std::map<std::string, int> ordinals;
    std::string anchor_key;
    pugi::xml_node last_app;
    bool after_app = false;
    std::vector<pugi::xml_node> placed;
    auto advance = [&](const std::string& tag) {
        auto it = ordinals.find(tag);
        int ordinal = it == ordinals.end() ? 0 : it->second + 1;
        ordinals[tag] = ordinal;
        anchor_key = tag + ":" + std::to_string(ordinal);
        after_app = false;
    };

    pugi::xml_node root = collation_.document_element();
    for (const auto& child : xml::element_children(root)) {
        std::string tag = xml::local_name(child);
        if (tag != "app") {
            advance(tag);
            continue;
        }
        pugi::xml_node app;
        if (after_app) {
            app = body.insert_copy_after(child, last_app);
        } else if (!anchor_key.empty()) {
            auto it = segments_by_key.find(anchor_key);
            if (it == segments_by_key.end()) {
                throw StructuralViolation("Collated element " + anchor_key + " has no counterpart in the lemma");
            }
            app = body.insert_copy_after(child, it->second);
        } else {
            app = body.prepend_copy(child);
        }
        last_app = app;
        after_app = true;
        placed.push_back(app);
        for (const auto& reading_child : xml::element_children(lemma_reading(app, lemma_))) {
            advance(xml::local_name(reading_child));
        }
    }

    // The lemma's own segments covered by each apparatus become its <lem/>
    for (auto& app : placed) {
        std::size_t remaining = xml::element_children(lemma_reading(app, lemma_)).size();
        pugi::xml_node lem = app.prepend_child(xml::element_name(app, "lem").c_str());
        pugi::xml_node next = app.next_sibling();
        while (remaining > 0 && next) {
            pugi::xml_node current = next;
            next = next.next_sibling();
            if (!xml::is_element(current, "seg")) {
                continue;
            }
            while (current.first_child()) {
                lem.append_move(current.first_child());
            }
            body.remove_child(current);
            --remaining;
        }
    }

    segmenter.desegment(segmented, lemma_doc_);
    if (debug_) {
        std::cerr << "[collatio] merged " << placed.size() << " apparatus entries into the lemma" << std::endl;
    }
}

} // namespace collatio
