#include "collatio/labeler.h"
#include "collatio/errors.h"
#include "collatio/plene.h"
#include "collatio/unicode_utils.h"
#include "collatio/xml_utils.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace collatio {

namespace {

const std::string kWord = "w";

// Levels sharing a rank replace each other in the hierarchy.
int division_rank(const std::string& type) {
    if (type == "book") {
        return 0;
    }
    if (type == "chapter" || type == "incipit" || type == "explicit") {
        return 1;
    }
    if (type == "verse") {
        return 2;
    }
    return 3;
}

bool is_chapter_substitute(const std::string& type) {
    return type == "incipit" || type == "explicit";
}

std::string index_of(const CitationContext& context, const std::string& level) {
    auto it = context.indices.find(level);
    return it == context.indices.end() ? std::string() : it->second;
}

std::string cite_levels(const CitationContext& context, std::size_t from) {
    std::string label;
    const auto& abbreviations = division_abbreviations();
    for (std::size_t i = from; i < context.hierarchy.size(); ++i) {
        const std::string& level = context.hierarchy[i];
        if (level == "verse" && context.outside_chapters()) {
            continue;
        }
        label += abbreviations.at(level) + index_of(context, level);
    }
    return label;
}

std::vector<std::string> split_tokens(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// Text of each child element, or its tag when it has none, separated by spaces.
std::string serialize_reading(const pugi::xml_node& reading) {
    std::string serialization;
    for (const auto& child : xml::element_children(reading)) {
        std::string text = xml::element_text(child);
        if (text.empty()) {
            text = xml::local_name(child);
        }
        if (!serialization.empty()) {
            serialization += " ";
        }
        serialization += text;
    }
    return serialization;
}

bool carries_pointing(const std::string& text) {
    icu::UnicodeString decomposed = unicode::decompose(unicode::to_unicode_string(text));
    return decomposed.length() != unicode::remove_all(decomposed, accent_class_set("pointing")).length();
}

pugi::xml_node require_lem(const pugi::xml_node& app) {
    std::vector<pugi::xml_node> lems = xml::element_children(app, "lem");
    if (lems.empty()) {
        std::string n = app.attribute("n").value();
        throw StructuralViolation("Apparatus" + (n.empty() ? std::string() : " " + n) + " has no <lem/> reading");
    }
    return lems.front();
}

} // namespace

const std::map<std::string, std::string>& division_abbreviations() {
    static const std::map<std::string, std::string> abbreviations = {
        {"book", "B"},
        {"incipit", "incipit"},
        {"explicit", "explicit"},
        {"chapter", "K"},
        {"verse", "V"},
        {"w", "U"},
    };
    return abbreviations;
}

void CitationContext::enter_division(const std::string& type, const std::string& n) {
    const auto& abbreviations = division_abbreviations();
    auto abbreviation = abbreviations.find(type);
    if (abbreviation == abbreviations.end() || type == kWord) {
        return;
    }

    // "B04K21V2" carries the indices of the enclosing levels as well
    std::string index = n;
    if (is_chapter_substitute(type)) {
        index.clear();
    } else {
        std::size_t at = n.rfind(abbreviation->second);
        if (at != std::string::npos) {
            index = n.substr(at + abbreviation->second.size());
        }
    }

    int rank = division_rank(type);
    for (auto it = hierarchy.begin(); it != hierarchy.end(); ++it) {
        if (division_rank(*it) == rank && *it != type) {
            indices.erase(*it);
            hierarchy.erase(it);
            break;
        }
    }
    auto position = std::find(hierarchy.begin(), hierarchy.end(), type);
    if (position == hierarchy.end()) {
        position = hierarchy.begin();
        while (position != hierarchy.end() && division_rank(*position) < rank) {
            ++position;
        }
        position = hierarchy.insert(position, type);
    }
    indices[type] = index;
    for (++position; position != hierarchy.end(); ++position) {
        indices[*position] = "0";
    }
}

void CitationContext::ensure_word_level() {
    if (std::find(hierarchy.begin(), hierarchy.end(), kWord) == hierarchy.end()) {
        hierarchy.push_back(kWord);
        indices[kWord] = "0";
    }
}

void CitationContext::add_words(int count) {
    ensure_word_level();
    indices[kWord] = std::to_string(std::stoi(indices[kWord]) + count);
}

bool CitationContext::outside_chapters() const {
    return std::any_of(hierarchy.begin(), hierarchy.end(), is_chapter_substitute);
}

bool CitationContext::operator==(const CitationContext& other) const {
    return hierarchy == other.hierarchy && indices == other.indices;
}

std::string cite(const CitationContext& at) {
    return cite_levels(at, 0);
}

std::string cite_range(const CitationContext& start, const CitationContext& end) {
    for (std::size_t i = 0; i < end.hierarchy.size(); ++i) {
        const std::string& level = end.hierarchy[i];
        if (index_of(start, level) != index_of(end, level)) {
            return cite(start) + "-" + cite_levels(end, i);
        }
    }
    return cite(start);
}

Labeler::Labeler() : stripped_(NormalizerConfig::fully_stripped()) {}

ApparatusType Labeler::classify(const pugi::xml_node& app) const {
    std::string lemma = stripped_.format_text(serialize_reading(require_lem(app)));
    std::vector<std::string> raw_readings;
    std::vector<std::string> readings;
    for (const auto& rdg : xml::element_children(app, "rdg")) {
        std::string raw = serialize_reading(rdg);
        std::string reading = stripped_.format_text(raw);
        // Readings equal to the stripped lemma are dropped before every rule below, not only the vocalic one
        if (reading != lemma) {
            raw_readings.push_back(raw);
            readings.push_back(reading);
        }
    }
    if (readings.empty()) {
        return ApparatusType::Vocalic;
    }

    std::string raw_lemma = serialize_reading(require_lem(app));
    std::string reduced_lemma = stripped_.format_text(strip_plene(raw_lemma));
    bool lemma_pointed = carries_pointing(raw_lemma);
    bool orthographic = true;
    for (std::size_t i = 0; i < readings.size() && orthographic; ++i) {
        if (stripped_.format_text(strip_plene(raw_readings[i])) == reduced_lemma) {
            continue;
        }
        // Unpointed spellings only differ by their matres lectionis
        orthographic = !lemma_pointed && !carries_pointing(raw_readings[i]) &&
                       consonantal_skeleton(readings[i]) == consonantal_skeleton(lemma);
    }
    if (orthographic) {
        return ApparatusType::Orthographic;
    }

    std::vector<std::string> lemma_tokens = split_tokens(lemma);
    std::vector<std::string> sorted_lemma = lemma_tokens;
    std::sort(sorted_lemma.begin(), sorted_lemma.end());
    bool transposition = true;
    bool addition = lemma_tokens.empty();
    bool omission = !lemma_tokens.empty();
    for (const auto& reading : readings) {
        std::vector<std::string> tokens = split_tokens(reading);
        addition = addition && !tokens.empty();
        omission = omission && tokens.empty();
        std::sort(tokens.begin(), tokens.end());
        transposition = transposition && tokens == sorted_lemma;
    }
    if (transposition) {
        return ApparatusType::Transposition;
    }
    if (addition) {
        return ApparatusType::Addition;
    }
    if (omission) {
        return ApparatusType::Omission;
    }
    return ApparatusType::Substitution;
}

void Labeler::add_types(pugi::xml_node root) const {
    for (auto& app : xml::descendants(root, "app")) {
        std::string type = to_string(classify(app));
        pugi::xml_attribute attr = app.attribute("type");
        if (!attr) {
            attr = app.append_attribute("type");
        }
        attr.set_value(type.c_str());
    }
}

void Labeler::add_indices(pugi::xml_node root) const {
    CitationContext context;
    index_node(root, context);
}

void Labeler::label(pugi::xml_node root) const {
    add_types(root);
    add_indices(root);
}

void Labeler::index_node(pugi::xml_node node, CitationContext& context) const {
    if (xml::is_division_marker(node)) {
        context.enter_division(xml::division_type(node), node.attribute("n").value());
        return;
    }
    if (xml::is_element(node, "w")) {
        context.add_words(2);
        return;
    }
    if (xml::is_element(node, "app")) {
        context.ensure_word_level();
        CitationContext start = context;
        for (const auto& child : xml::element_children(require_lem(node))) {
            index_node(child, context);
        }
        std::string n = label_apparatus(node, start, context);
        pugi::xml_attribute attr = node.attribute("n");
        if (!attr) {
            attr = node.append_attribute("n");
        }
        attr.set_value(n.c_str());
        if (debug_) {
            std::cerr << "[collatio] apparatus " << n << " (" << node.attribute("type").value() << ")" << std::endl;
        }
        return;
    }
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
        if (child.type() == pugi::node_element) {
            index_node(child, context);
        }
    }
}

std::string Labeler::label_apparatus(const pugi::xml_node& app, const CitationContext& start,
                                     const CitationContext& end) const {
    CitationContext at = start;
    if (start == end) {
        // An empty lemma sits between two words
        if (!xml::descendants(app, "w").empty()) {
            at.add_words(1);
        }
        return cite(at);
    }
    at.add_words(2);
    if (at == end) {
        return cite(at);
    }
    return cite_range(at, end);
}

} // namespace collatio
