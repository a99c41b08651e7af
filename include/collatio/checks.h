#pragma once

#include <pugixml.hpp>

#include <string>
#include <vector>

namespace collatio {

struct Finding {
    std::string word;
    std::string division;  // n of the latest division marker, empty before the first
};

// Body-level words that carry no accent of any class.
std::vector<Finding> find_unpointed_words(const pugi::xml_document& doc);

// Body-level words with a holam haser for vav (05BA) on a letter other than vav.
std::vector<Finding> find_invalid_holam(const pugi::xml_document& doc);

} // namespace collatio
