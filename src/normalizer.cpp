#include "collatio/normalizer.h"
#include "collatio/errors.h"
#include "collatio/unicode_utils.h"
#include "collatio/xml_utils.h"

#include <iostream>
#include <utility>

namespace collatio {

namespace {

using unicode::compose;
using unicode::decompose;
using unicode::from_unicode_string;
using unicode::remove_all;
using unicode::to_unicode_string;

// Meteg (05BD) is a point by name but behaves as an accent.
const icu::UnicodeSet& cantillation_set() {
    static const icu::UnicodeSet set = unicode::make_set("[\\u0591-\\u05AF\\u05BD\\u200C-\\u200D]");
    return set;
}

const icu::UnicodeSet& pointing_set() {
    static const icu::UnicodeSet set = unicode::make_set("[\\u05B0-\\u05BC\\u05BF\\u05C1-\\u05C2\\u05C7]");
    return set;
}

const icu::UnicodeSet& extraordinaire_set() {
    static const icu::UnicodeSet set = unicode::make_set("[\\u05C4-\\u05C5]");
    return set;
}

const std::set<std::string>& structural_tags() {
    static const std::set<std::string> tags = {"TEI", "text", "body"};
    return tags;
}

void copy_attributes(const pugi::xml_node& from, pugi::xml_node to) {
    for (const auto& attr : from.attributes()) {
        pugi::xml_attribute existing = to.attribute(attr.name());
        if (existing) {
            existing.set_value(attr.value());
        } else {
            to.append_attribute(attr.name()) = attr.value();
        }
    }
}

} // namespace

const std::vector<std::string>& accent_classes() {
    static const std::vector<std::string> classes = {"cantillation", "pointing", "extraordinaire"};
    return classes;
}

const icu::UnicodeSet& accent_class_set(const std::string& name) {
    if (name == "cantillation") {
        return cantillation_set();
    }
    if (name == "pointing") {
        return pointing_set();
    }
    if (name == "extraordinaire") {
        return extraordinaire_set();
    }
    throw ConfigurationConflict("Unknown accent class: " + name);
}

NormalizerConfig NormalizerConfig::fully_stripped() {
    NormalizerConfig config;
    config.accents.insert(accent_classes().begin(), accent_classes().end());
    return config;
}

NormalizerConfig make_normalizer_config(const Settings& settings) {
    NormalizerConfig config;
    config.accents.insert(settings.accents.begin(), settings.accents.end());
    for (const auto& code_point : settings.punctuation) {
        config.punctuation.insert(unicode::code_point_from_hex(code_point));
    }
    config.preferred_reading = settings.reading;
    config.ignored_tags.insert(settings.tags.begin(), settings.tags.end());
    return config;
}

Normalizer::Normalizer(NormalizerConfig config) : config_(std::move(config)) {
    for (const auto& tag : config_.ignored_tags) {
        if (structural_tags().count(tag) > 0) {
            throw ConfigurationConflict("\"" + tag + "\" cannot be an ignored element (the document structure would be lost)");
        }
    }
    for (const auto& accent : config_.accents) {
        stripped_.addAll(accent_class_set(accent));
    }
    stripped_.freeze();
}

std::string Normalizer::format_text(const std::string& text) const {
    icu::UnicodeString ustr = decompose(to_unicode_string(text));
    if (!stripped_.isEmpty()) {
        ustr = remove_all(ustr, stripped_);
    }
    return from_unicode_string(compose(ustr));
}

void Normalizer::normalize(const pugi::xml_document& in, pugi::xml_document& out) const {
    out.reset();
    for (pugi::xml_node child = in.first_child(); child; child = child.next_sibling()) {
        if (child.type() != pugi::node_element) {
            out.append_copy(child);
            continue;
        }
        pugi::xml_node root = out.append_child(child.name());
        copy_attributes(child, root);
        normalize_children(child, root);
    }
}

bool Normalizer::is_ignored(const pugi::xml_node& child) const {
    std::string local = xml::local_name(child);
    if (config_.ignored_tags.count(local) > 0) {
        return true;
    }
    if (local == "pc" && !config_.punctuation.empty()) {
        return config_.punctuation.count(xml::element_text(child)) > 0;
    }
    return false;
}

void Normalizer::normalize_children(const pugi::xml_node& in, pugi::xml_node out) const {
    for (pugi::xml_node child = in.first_child(); child; child = child.next_sibling()) {
        switch (child.type()) {
            case pugi::node_pcdata:
            case pugi::node_cdata:
                // Text after a dropped element lands on the previous output sibling, or leads the parent
                xml::append_text(out, format_text(child.value()));
                break;
            case pugi::node_element:
                if (is_ignored(child)) {
                    if (debug_) {
                        std::cerr << "[collatio] dropping <" << child.name() << ">" << std::endl;
                    }
                    break;
                }
                append_normalized(child, out);
                break;
            default:
                out.append_copy(child);
                break;
        }
    }
}

void Normalizer::collapse_apparatus(const pugi::xml_node& app, pugi::xml_node out) const {
    for (const auto& rdg : xml::element_children(app, "rdg")) {
        if (config_.preferred_reading == rdg.attribute("type").value()) {
            normalize_children(rdg, out);
            return;
        }
    }
    std::string label = app.attribute("n") ? std::string(" ") + app.attribute("n").value() : std::string();
    throw StructuralViolation("Apparatus" + label + " has no reading of type \"" + config_.preferred_reading + "\"");
}

void Normalizer::append_normalized(const pugi::xml_node& child, pugi::xml_node out) const {
    std::string local = xml::local_name(child);
    if (local == "app" && !config_.preferred_reading.empty()) {
        collapse_apparatus(child, out);
        return;
    }
    if (local == "div" || local == "ab" || local == "divGen") {
        // Containers become flat markers followed by their former content
        pugi::xml_node marker = out.append_child(xml::element_name(child, "divGen").c_str());
        if (local == "ab") {
            marker.append_attribute("type") = "verse";
        }
        copy_attributes(child, marker);
        normalize_children(child, out);
        return;
    }
    pugi::xml_node element = out.append_child(child.name());
    copy_attributes(child, element);
    normalize_children(child, element);
}

} // namespace collatio
