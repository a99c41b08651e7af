#include "collatio/tokens.h"
#include "collatio/errors.h"
#include "collatio/xml_utils.h"

namespace collatio {

bool opens_unit(const pugi::xml_node& node, const std::string& level) {
    if (!xml::is_division_marker(node) || !node.attribute("n")) {
        return false;
    }
    std::string type = xml::division_type(node);
    return type == level || type == "incipit" || type == "explicit";
}

std::vector<DivisionTokens> extract_division_tokens(const pugi::xml_document& formatted,
                                                    const pugi::xml_document& stripped,
                                                    const std::string& level,
                                                    const std::set<std::string>& ignored_tags) {
    std::vector<pugi::xml_node> t_elements = xml::element_children(xml::require_body(formatted));
    std::vector<pugi::xml_node> n_elements = xml::element_children(xml::require_body(stripped));
    if (t_elements.size() != n_elements.size()) {
        throw StructuralViolation("Formatted and stripped normalizations differ in structure (" +
                                  std::to_string(t_elements.size()) + " vs " +
                                  std::to_string(n_elements.size()) + " elements)");
    }

    std::vector<DivisionTokens> divisions;
    TokenList leading;
    for (std::size_t i = 0; i < t_elements.size(); ++i) {
        const pugi::xml_node& t_element = t_elements[i];
        const pugi::xml_node& n_element = n_elements[i];
        if (opens_unit(t_element, level)) {
            divisions.push_back(DivisionTokens{t_element.attribute("n").value(), {}});
            // Content before the first unit belongs to it
            if (divisions.size() == 1) {
                divisions.back().tokens.swap(leading);
            }
        }
        if (ignored_tags.count(xml::local_name(t_element)) > 0) {
            continue;
        }
        Token token;
        token.t = xml::serialize(t_element);
        token.n = xml::element_text(n_element);
        if (token.n.empty()) {
            token.n = xml::local_name(n_element);
        }
        (divisions.empty() ? leading : divisions.back().tokens).push_back(token);
    }

    for (auto& division : divisions) {
        if (division.tokens.empty()) {
            division.tokens.push_back(omission_token());
        }
    }
    return divisions;
}

} // namespace collatio
