#include "collatio/xml_utils.h"
#include "collatio/errors.h"

#include <cstring>
#include <sstream>
#include <stdexcept>

namespace collatio {
namespace xml {

namespace {

void collect_text(const pugi::xml_node& node, std::string& out) {
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            out += child.value();
        } else if (child.type() == pugi::node_element) {
            collect_text(child, out);
        }
    }
}

} // namespace

std::string local_name(const pugi::xml_node& node) {
    const char* name = node.name();
    const char* colon = std::strchr(name, ':');
    return colon ? std::string(colon + 1) : std::string(name);
}

bool is_element(const pugi::xml_node& node, const char* local) {
    return node.type() == pugi::node_element && local_name(node) == local;
}

std::string element_name(const pugi::xml_node& reference, const std::string& local) {
    std::string name = reference.name();
    std::size_t colon = name.find(':');
    if (colon == std::string::npos) {
        return local;
    }
    return name.substr(0, colon + 1) + local;
}

std::vector<pugi::xml_node> descendants(const pugi::xml_node& root, const std::string& local) {
    std::vector<pugi::xml_node> result;
    std::string query = ".//*[local-name()='" + local + "']";
    for (const auto& xp_node : root.select_nodes(query.c_str())) {
        result.push_back(xp_node.node());
    }
    return result;
}

pugi::xml_node first_descendant(const pugi::xml_node& root, const std::string& local) {
    std::string query = ".//*[local-name()='" + local + "']";
    return root.select_node(query.c_str()).node();
}

std::vector<pugi::xml_node> element_children(const pugi::xml_node& node, const std::string& local) {
    std::vector<pugi::xml_node> result;
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
        if (child.type() != pugi::node_element) {
            continue;
        }
        if (local.empty() || local_name(child) == local) {
            result.push_back(child);
        }
    }
    return result;
}

pugi::xml_node require_body(const pugi::xml_node& root) {
    pugi::xml_node text = first_descendant(root, "text");
    pugi::xml_node body = text ? first_descendant(text, "body") : pugi::xml_node();
    if (!body) {
        throw StructuralViolation("Document has no <text/><body/> element");
    }
    return body;
}

std::string id_of(const pugi::xml_node& node) {
    if (pugi::xml_attribute attr = node.attribute("xml:id")) {
        return attr.value();
    }
    return node.attribute("id").value();
}

bool is_division_marker(const pugi::xml_node& node) {
    return !division_type(node).empty();
}

std::string division_type(const pugi::xml_node& node) {
    if (is_element(node, "divGen")) {
        return node.attribute("type").value();
    }
    if (is_element(node, "milestone")) {
        return node.attribute("unit").value();
    }
    return "";
}

std::string element_text(const pugi::xml_node& node) {
    std::string text;
    collect_text(node, text);
    return text;
}

std::string serialize(const pugi::xml_node& node) {
    std::ostringstream stream;
    node.print(stream, "", pugi::format_raw, pugi::encoding_utf8);
    return stream.str();
}

std::string serialize_children(const pugi::xml_node& node) {
    std::ostringstream stream;
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
        child.print(stream, "", pugi::format_raw, pugi::encoding_utf8);
    }
    return stream.str();
}

void append_text(pugi::xml_node parent, const std::string& text) {
    if (text.empty()) {
        return;
    }
    pugi::xml_node last = parent.last_child();
    if (last && last.type() == pugi::node_pcdata) {
        std::string merged = std::string(last.value()) + text;
        last.set_value(merged.c_str());
        return;
    }
    parent.append_child(pugi::node_pcdata).set_value(text.c_str());
}

std::vector<std::string> witness_references(const pugi::xml_node& reading) {
    std::vector<std::string> result;
    std::istringstream refs(reading.attribute("wit").value());
    std::string ref;
    while (refs >> ref) {
        if (!ref.empty() && ref[0] == '#') {
            ref = ref.substr(1);
        }
        result.push_back(ref);
    }
    return result;
}

bool cites_witness(const pugi::xml_node& reading, const std::string& witness) {
    for (const auto& ref : witness_references(reading)) {
        if (ref == witness) {
            return true;
        }
    }
    return false;
}

void load_document(pugi::xml_document& doc, const std::string& path) {
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::runtime_error("Failed to load TEI document: " + path + " (" + result.description() + ")");
    }
}

void load_string(pugi::xml_document& doc, const std::string& contents) {
    pugi::xml_parse_result result = doc.load_string(contents.c_str());
    if (!result) {
        throw std::runtime_error(std::string("Failed to parse XML: ") + result.description());
    }
}

void save_document(const pugi::xml_document& doc, const std::string& path) {
    if (!doc.save_file(path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8)) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
}

std::string dump_document(const pugi::xml_document& doc) {
    std::ostringstream stream;
    doc.save(stream, "  ", pugi::format_default, pugi::encoding_utf8);
    return stream.str();
}

} // namespace xml
} // namespace collatio
