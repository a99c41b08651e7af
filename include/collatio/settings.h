#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace collatio {

struct Settings {
    std::unordered_map<std::string, std::string> options;
    std::vector<std::string> accents;      // accent classes to strip
    std::vector<std::string> punctuation;  // hex code points of punctuation to drop
    std::vector<std::string> tags;         // element tags to ignore
    std::vector<std::string> inputs;       // positional arguments
    std::string reading;                   // preferred reading type
    std::string level = "verse";
    std::string profile;
    std::string settings_file;
    std::string output;
    bool verbose = false;
    bool debug = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    bool get_bool(const std::string& key, bool fallback) const;
    bool has(const std::string& key) const;

    // --output if given, else `input` with ".xml" replaced by suffix + ".xml"
    std::string output_for(const std::string& input, const std::string& suffix) const;
};

Settings parse_arguments(int argc, char** argv);
Settings load_settings(const Settings& base);

} // namespace collatio
