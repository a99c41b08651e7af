#include "collatio/collation_editor.h"
#include "collatio/errors.h"
#include "collatio/segmenter.h"
#include "collatio/xml_utils.h"

#include <iostream>
#include <memory>

namespace collatio {

namespace {

std::size_t count_segment_markers(const pugi::xml_node& reading) {
    std::size_t count = 0;
    for (const auto& marker : xml::descendants(reading, "divGen")) {
        if (std::string(marker.attribute("type").value()) == "seg") {
            ++count;
        }
    }
    return count;
}

std::string apparatus_label(const pugi::xml_node& app) {
    if (app.attribute("n")) {
        return app.attribute("n").value();
    }
    return xml::id_of(app);
}

pugi::xml_node require_lem(const pugi::xml_node& app) {
    std::vector<pugi::xml_node> lems = xml::element_children(app, "lem");
    if (lems.empty()) {
        std::string label = apparatus_label(app);
        throw StructuralViolation("Apparatus" + (label.empty() ? std::string() : " " + label) + " has no <lem/> reading");
    }
    return lems.front();
}

pugi::xml_node reading_for(const pugi::xml_node& app, const std::string& witness) {
    pugi::xml_node found;
    for (const auto& rdg : xml::element_children(app, "rdg")) {
        if (!xml::cites_witness(rdg, witness)) {
            continue;
        }
        if (found) {
            throw AmbiguousWitnessMembership("Witness " + witness + " is cited by more than one reading of apparatus " +
                                             apparatus_label(app));
        }
        found = rdg;
    }
    if (!found) {
        std::string label = apparatus_label(app);
        throw UnknownWitnessMembership("Witness " + witness + " is not cited by any reading of apparatus" +
                                       (label.empty() ? std::string() : " " + label));
    }
    return found;
}

// Replaces every body-level app of a copy of `doc` by the content of the chosen reading.
template <typename Selector>
void project(const pugi::xml_document& doc, pugi::xml_document& out, Selector select_reading) {
    out.reset(doc);
    pugi::xml_node body = xml::require_body(out);
    std::vector<pugi::xml_node> apps = xml::element_children(body, "app");
    for (const auto& app : apps) {
        pugi::xml_node reading = select_reading(app);
        std::vector<pugi::xml_node> content;
        for (pugi::xml_node child = reading.first_child(); child; child = child.next_sibling()) {
            content.push_back(child);
        }
        for (const auto& child : content) {
            body.insert_move_before(child, app);
        }
        body.remove_child(app);
    }
}

void copy_content(const pugi::xml_node& from, pugi::xml_node to) {
    for (pugi::xml_node child = from.first_child(); child; child = child.next_sibling()) {
        if (child.type() == pugi::node_pcdata) {
            xml::append_text(to, child.value());
        } else {
            to.append_copy(child);
        }
    }
}

struct ReadingGroup {
    std::string serialization;
    pugi::xml_node segment;
    std::vector<std::string> witnesses;
};

} // namespace

std::vector<SegmentMismatch> CollationEditor::validate(const pugi::xml_document& doc) const {
    std::vector<SegmentMismatch> mismatches;
    for (const auto& app : xml::descendants(doc, "app")) {
        std::size_t lemma_count = count_segment_markers(require_lem(app));
        for (const auto& rdg : xml::element_children(app, "rdg")) {
            std::size_t reading_count = count_segment_markers(rdg);
            if (reading_count == lemma_count) {
                continue;
            }
            SegmentMismatch mismatch;
            mismatch.app = apparatus_label(app);
            mismatch.witnesses = rdg.attribute("wit").value();
            mismatch.lemma_count = lemma_count;
            mismatch.reading_count = reading_count;
            mismatches.push_back(mismatch);
            if (debug_) {
                std::cerr << "[collatio] " << mismatch.describe() << std::endl;
            }
        }
    }
    return mismatches;
}

std::vector<std::string> CollationEditor::get_witnesses(const pugi::xml_document& doc) const {
    pugi::xml_node list = xml::first_descendant(doc, "listWit");
    if (!list) {
        throw StructuralViolation("Collation has no <listWit/> element");
    }
    std::vector<std::string> witnesses;
    for (const auto& witness : xml::descendants(list, "witness")) {
        std::string id = xml::id_of(witness);
        if (id.empty()) {
            throw StructuralViolation("A <witness/> in <listWit/> has no xml:id");
        }
        witnesses.push_back(id);
    }
    return witnesses;
}

void CollationEditor::get_lemma_xml(const pugi::xml_document& doc, pugi::xml_document& out) const {
    project(doc, out, [](const pugi::xml_node& app) { return require_lem(app); });
}

void CollationEditor::get_witness_xml(const pugi::xml_document& doc, const std::string& witness,
                                      pugi::xml_document& out) const {
    project(doc, out, [&witness](const pugi::xml_node& app) { return reading_for(app, witness); });
}

void CollationEditor::update_boundaries(const pugi::xml_document& in, pugi::xml_document& out) const {
    std::vector<SegmentMismatch> mismatches = validate(in);
    if (!mismatches.empty()) {
        throw ResegmentationMismatch(mismatches);
    }
    std::vector<std::string> witnesses = get_witnesses(in);

    pugi::xml_document lemma_projection;
    pugi::xml_document lemma_segmented;
    get_lemma_xml(in, lemma_projection);
    Segmenter::split_at_markers(lemma_projection, lemma_segmented);
    std::vector<pugi::xml_node> lemma_segments = Segmenter::segments(lemma_segmented);

    std::vector<std::unique_ptr<pugi::xml_document>> witness_docs;
    std::vector<std::vector<pugi::xml_node>> witness_segments;
    for (const auto& witness : witnesses) {
        pugi::xml_document projection;
        get_witness_xml(in, witness, projection);
        auto segmented = std::make_unique<pugi::xml_document>();
        Segmenter::split_at_markers(projection, *segmented);
        witness_segments.push_back(Segmenter::segments(*segmented));
        if (witness_segments.back().size() != lemma_segments.size()) {
            throw StructuralViolation("Witness " + witness + " has " + std::to_string(witness_segments.back().size()) +
                                      " segments where the lemma has " + std::to_string(lemma_segments.size()));
        }
        witness_docs.push_back(std::move(segmented));
    }

    out.reset(in);
    pugi::xml_node body = xml::require_body(out);
    while (body.first_child()) {
        body.remove_child(body.first_child());
    }

    std::size_t created = 0;
    for (std::size_t i = 0; i < lemma_segments.size(); ++i) {
        std::vector<ReadingGroup> groups;
        for (std::size_t w = 0; w < witnesses.size(); ++w) {
            pugi::xml_node segment = witness_segments[w][i];
            std::string serialization = xml::serialize_children(segment);
            bool grouped = false;
            for (auto& group : groups) {
                if (group.serialization == serialization) {
                    group.witnesses.push_back(witnesses[w]);
                    grouped = true;
                    break;
                }
            }
            if (!grouped) {
                groups.push_back(ReadingGroup{serialization, segment, {witnesses[w]}});
            }
        }

        if (groups.size() <= 1) {
            copy_content(lemma_segments[i], body);
            continue;
        }

        pugi::xml_node app = body.append_child(xml::element_name(body, "app").c_str());
        pugi::xml_node lem = app.append_child(xml::element_name(body, "lem").c_str());
        copy_content(lemma_segments[i], lem);
        for (const auto& group : groups) {
            pugi::xml_node rdg = app.append_child(xml::element_name(body, "rdg").c_str());
            std::string wit;
            for (const auto& witness : group.witnesses) {
                wit += (wit.empty() ? "#" : " #") + witness;
            }
            rdg.append_attribute("wit") = wit.c_str();
            copy_content(group.segment, rdg);
        }
        ++created;
    }

    if (debug_) {
        std::cerr << "[collatio] " << lemma_segments.size() << " segments, " << created
                  << " apparatus entries after resegmentation" << std::endl;
    }
}

} // namespace collatio
