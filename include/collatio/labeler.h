#pragma once

#include "normalizer.h"
#include "types.h"

#include <pugixml.hpp>

#include <map>
#include <string>
#include <vector>

namespace collatio {

// Abbreviation of each citable level ("book" -> "B", ..., "w" -> "U").
const std::map<std::string, std::string>& division_abbreviations();

// Running division and word indices of one left-to-right pass.
struct CitationContext {
    std::vector<std::string> hierarchy;  // active levels, outermost first
    std::map<std::string, std::string> indices;

    void enter_division(const std::string& type, const std::string& n);
    void add_words(int count);
    void ensure_word_level();
    bool outside_chapters() const;  // incipit or explicit active

    bool operator==(const CitationContext& other) const;
    bool operator!=(const CitationContext& other) const { return !(*this == other); }
};

std::string cite(const CitationContext& at);
std::string cite_range(const CitationContext& start, const CitationContext& end);

class Labeler {
public:
    Labeler();

    void set_debug(bool debug) { debug_ = debug; }

    ApparatusType classify(const pugi::xml_node& app) const;

    // Sets type on every app of the document.
    void add_types(pugi::xml_node root) const;
    // Sets n on every app reachable through lemma readings.
    void add_indices(pugi::xml_node root) const;
    void label(pugi::xml_node root) const;

private:
    Normalizer stripped_;
    bool debug_ = false;

    void index_node(pugi::xml_node node, CitationContext& context) const;
    std::string label_apparatus(const pugi::xml_node& app, const CitationContext& start,
                                const CitationContext& end) const;
};

} // namespace collatio
