#pragma once

#include <pugixml.hpp>

#include <set>
#include <string>
#include <vector>

namespace collatio {

// Where an element attaches: to the segment before it, its own, or the one after it.
enum class Position {
    Previous = -1,
    Current = 0,
    Next = 1
};

// State before the first element of a body.
constexpr Position kInitialPosition = Position::Next;

// True when `current` must start a new segment after an element at `previous`.
bool opens_boundary(Position previous, Position current);

// Value of seg/@function on the wrappers this module creates.
extern const char* const kSegmentFunction;

class Segmenter {
public:
    explicit Segmenter(std::set<std::string> ignored_tags);

    void set_debug(bool debug) { debug_ = debug; }

    // Substantive tags are Current, ignored division markers Next, other ignored tags Previous.
    Position position_of(const std::string& tag) const;

    // Rewrites the body of a copy of `in` as a flat list of <seg function="segment"/>.
    void segment(const pugi::xml_document& in, pugi::xml_document& out) const;

    // Splices the content of every segment wrapper back into the body.
    void desegment(const pugi::xml_document& in, pugi::xml_document& out) const;

    // Splits the body at <divGen type="seg"/> markers, which are consumed.
    static void split_at_markers(const pugi::xml_document& in, pugi::xml_document& out);

    // Segment wrappers directly under the body, in order.
    static std::vector<pugi::xml_node> segments(const pugi::xml_node& root);

private:
    std::set<std::string> ignored_tags_;
    bool debug_ = false;
};

} // namespace collatio
