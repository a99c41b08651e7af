#pragma once

#include <string>
#include <vector>

namespace collatio {

// One rewrite of an interior letter cluster (a letter with its points).
struct PleneRule {
    const char* name;
    char32_t letter;
    std::u32string points;              // exact points the cluster must carry
    char32_t after_letter;              // required unpointed previous letter, 0 for any
    std::u32string previous_vowels;     // previous cluster must carry one of these, empty for any
    bool drop_previous;                 // also drop the previous cluster
    char32_t add_to_preceding;          // point added to the cluster kept before the dropped ones, 0 for none
};

// Rules in the order they are tried; the first match wins.
const std::vector<PleneRule>& plene_rules();

// Replaces plene spellings with their defective vocalization; first and last letters of a word are kept.
std::string strip_plene(const std::string& text);

// Letters only, with interior alef, vav and yod removed from every word.
std::string consonantal_skeleton(const std::string& text);

} // namespace collatio
