#include "collatio/settings.h"

#include <pugixml.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace collatio {

std::string Settings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

bool Settings::get_bool(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    const std::string& val = it->second;
    return val == "1" || val == "true" || val == "TRUE" || val == "yes";
}

bool Settings::has(const std::string& key) const {
    return options.find(key) != options.end();
}

std::string Settings::output_for(const std::string& input, const std::string& suffix) const {
    if (!output.empty()) {
        return output;
    }
    const std::string extension = ".xml";
    if (input.size() > extension.size() &&
        input.compare(input.size() - extension.size(), extension.size(), extension) == 0) {
        return input.substr(0, input.size() - extension.size()) + suffix + extension;
    }
    return input + suffix + extension;
}

namespace {

// "a,b c" -> {"a", "b", "c"}
std::vector<std::string> split_list(const std::string& value) {
    std::string spaced = value;
    std::replace(spaced.begin(), spaced.end(), ',', ' ');
    std::istringstream stream(spaced);
    std::vector<std::string> items;
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

void append_unique(std::vector<std::string>& list, const std::string& value) {
    for (const auto& item : split_list(value)) {
        if (std::find(list.begin(), list.end(), item) == list.end()) {
            list.push_back(item);
        }
    }
}

void push_option(Settings& settings, const std::string& key, const std::string& value) {
    if (key == "accent") {
        append_unique(settings.accents, value);
    } else if (key == "punctuation") {
        append_unique(settings.punctuation, value);
    } else if (key == "tag") {
        append_unique(settings.tags, value);
    } else if (key == "reading") {
        settings.reading = value;
    } else if (key == "level") {
        settings.level = value;
    } else if (key == "profile") {
        settings.profile = value;
    } else if (key == "settings") {
        settings.settings_file = value;
    } else if (key == "output") {
        settings.output = value;
    }
    // List options keep their accumulated value in the map as well
    auto it = settings.options.find(key);
    if (it != settings.options.end() && (key == "accent" || key == "punctuation" || key == "tag")) {
        it->second += "," + value;
    } else {
        settings.options[key] = value;
    }
    if (key == "verbose") {
        settings.verbose = settings.get_bool("verbose", false);
    } else if (key == "debug") {
        settings.debug = settings.get_bool("debug", false);
    }
}

} // namespace

Settings parse_arguments(int argc, char** argv) {
    Settings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            settings.inputs.push_back(arg);
            continue;
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            std::string key = arg.substr(2);
            push_option(settings, key, "1");
        } else {
            std::string key = arg.substr(2, eq - 2);
            std::string value = arg.substr(eq + 1);
            push_option(settings, key, value);
        }
    }
    return settings;
}

Settings load_settings(const Settings& base) {
    Settings combined = base;
    std::string settings_path = base.settings_file.empty() ? "./Resources/settings.xml" : base.settings_file;

    pugi::xml_document doc;
    if (!doc.load_file(settings_path.c_str())) {
        throw std::runtime_error("Failed to load settings file: " + settings_path);
    }

    pugi::xpath_node_set profile_nodes = doc.select_nodes("//collatio/profiles/item");
    pugi::xml_node selected;

    for (const auto& node : profile_nodes) {
        pugi::xml_node profile = node.node();
        if (!base.profile.empty()) {
            if (std::string(profile.attribute("id").value()) == base.profile) {
                selected = profile;
                break;
            }
        } else if (!profile.attribute("restriction") ||
                   doc.select_node(profile.attribute("restriction").value())) {
            selected = profile;
            break;
        }
    }

    if (!selected) {
        throw std::runtime_error("No matching profile found in " + settings_path);
    }

    // Command-line values win over the profile, the profile over the defaults of <collatio/>
    for (const auto& attr : selected.attributes()) {
        std::string key = attr.name();
        if (key == "id" || key == "restriction" || base.has(key)) {
            continue;
        }
        push_option(combined, key, attr.value());
    }
    pugi::xml_node parent = selected.parent().parent();
    if (parent) {
        for (const auto& attr : parent.attributes()) {
            if (combined.has(attr.name())) {
                continue;
            }
            push_option(combined, attr.name(), attr.value());
        }
    }

    return combined;
}

} // namespace collatio
