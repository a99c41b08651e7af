#pragma once

#include "settings.h"

#include <pugixml.hpp>
#include <unicode/uniset.h>

#include <set>
#include <string>
#include <vector>

namespace collatio {

struct NormalizerConfig {
    std::set<std::string> accents;        // cantillation, pointing, extraordinaire
    std::set<std::string> punctuation;    // pc text values to drop
    std::string preferred_reading;        // rdg/@type that replaces each app, empty keeps apps
    std::set<std::string> ignored_tags;

    // Configuration that strips every accent class and nothing else.
    static NormalizerConfig fully_stripped();
};

// Accent class names understood by the normalizer, in canonical order.
const std::vector<std::string>& accent_classes();

// Characters of one accent class; throws ConfigurationConflict for unknown names.
const icu::UnicodeSet& accent_class_set(const std::string& name);

NormalizerConfig make_normalizer_config(const Settings& settings);

class Normalizer {
public:
    // Throws ConfigurationConflict for unknown accent classes or ignored TEI/text/body.
    explicit Normalizer(NormalizerConfig config);

    void set_debug(bool debug) { debug_ = debug; }
    const NormalizerConfig& config() const { return config_; }

    // NFD, strip the configured accent classes, NFC.
    std::string format_text(const std::string& text) const;

    // Writes the normalized form of `in` into `out`; `in` is left untouched.
    void normalize(const pugi::xml_document& in, pugi::xml_document& out) const;

private:
    NormalizerConfig config_;
    icu::UnicodeSet stripped_;
    bool debug_ = false;

    bool is_ignored(const pugi::xml_node& child) const;
    void normalize_children(const pugi::xml_node& in, pugi::xml_node out) const;
    void collapse_apparatus(const pugi::xml_node& app, pugi::xml_node out) const;
    void append_normalized(const pugi::xml_node& child, pugi::xml_node out) const;
};

} // namespace collatio
