#pragma once

#include "types.h"

#include <pugixml.hpp>

#include <set>
#include <string>
#include <vector>

namespace collatio {

// True for a division marker that opens a collation unit at `level`.
bool opens_unit(const pugi::xml_node& node, const std::string& level);

// Pairs the body elements of two normalizations of the same transcription into
// per-division token lists: t is the formatted element's markup, n the stripped element's text.
// Elements whose tag is ignored still open units but are not emitted as tokens.
// Elements before the first unit are folded into it; without any unit nothing is returned.
std::vector<DivisionTokens> extract_division_tokens(const pugi::xml_document& formatted,
                                                    const pugi::xml_document& stripped,
                                                    const std::string& level,
                                                    const std::set<std::string>& ignored_tags);

} // namespace collatio
