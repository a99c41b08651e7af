#pragma once

#include <pugixml.hpp>

#include <string>
#include <vector>

namespace collatio {
namespace xml {

// Element name without its namespace prefix ("tei:app" -> "app").
std::string local_name(const pugi::xml_node& node);
bool is_element(const pugi::xml_node& node, const char* local);

// Name for a new element that shares the prefix of `reference`.
std::string element_name(const pugi::xml_node& reference, const std::string& local);

std::vector<pugi::xml_node> descendants(const pugi::xml_node& root, const std::string& local);
pugi::xml_node first_descendant(const pugi::xml_node& root, const std::string& local);
std::vector<pugi::xml_node> element_children(const pugi::xml_node& node, const std::string& local = "");

// The <body/> of a TEI document; throws StructuralViolation if absent.
pugi::xml_node require_body(const pugi::xml_node& root);

// xml:id, falling back to id.
std::string id_of(const pugi::xml_node& node);

// divGen[@type] and milestone[@unit] both mark textual divisions.
bool is_division_marker(const pugi::xml_node& node);
std::string division_type(const pugi::xml_node& node);

// All character data under the node, in document order.
std::string element_text(const pugi::xml_node& node);

std::string serialize(const pugi::xml_node& node);
std::string serialize_children(const pugi::xml_node& node);

// Appends character data, merging with a trailing text node if there is one.
void append_text(pugi::xml_node parent, const std::string& text);

// Witness references of a wit attribute ("#A #B" -> {"A", "B"}).
std::vector<std::string> witness_references(const pugi::xml_node& reading);
bool cites_witness(const pugi::xml_node& reading, const std::string& witness);

void load_document(pugi::xml_document& doc, const std::string& path);
void load_string(pugi::xml_document& doc, const std::string& contents);
void save_document(const pugi::xml_document& doc, const std::string& path);
std::string dump_document(const pugi::xml_document& doc);

} // namespace xml
} // namespace collatio
