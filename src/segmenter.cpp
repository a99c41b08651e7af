#include "collatio/segmenter.h"
#include "collatio/xml_utils.h"

#include <iostream>
#include <map>
#include <utility>

namespace collatio {

const char* const kSegmentFunction = "segment";

namespace {

// Markers that belong with the content following them.
const std::set<std::string>& prefix_tags() {
    static const std::set<std::string> tags = {"divGen"};
    return tags;
}

std::vector<pugi::xml_node> snapshot_children(const pugi::xml_node& node) {
    std::vector<pugi::xml_node> children;
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
        children.push_back(child);
    }
    return children;
}

bool is_segment(const pugi::xml_node& node) {
    return xml::is_element(node, "seg") &&
           std::string(node.attribute("function").value()) == kSegmentFunction;
}

bool is_segment_marker(const pugi::xml_node& node) {
    return xml::is_element(node, "divGen") && std::string(node.attribute("type").value()) == "seg";
}

// Appends a wrapper at the end of the body and moves the queued nodes into it.
pugi::xml_node seal(pugi::xml_node body, std::vector<pugi::xml_node>& queue,
                    const std::string& type, const std::string& n) {
    pugi::xml_node seg = body.append_child(xml::element_name(body, "seg").c_str());
    seg.append_attribute("function") = kSegmentFunction;
    if (!type.empty()) {
        seg.append_attribute("type") = type.c_str();
        seg.append_attribute("n") = n.c_str();
    }
    for (const auto& node : queue) {
        seg.append_move(node);
    }
    queue.clear();
    return seg;
}

} // namespace

bool opens_boundary(Position previous, Position current) {
    if (current == Position::Current && previous == Position::Current) {
        return true;
    }
    return current > previous;
}

Segmenter::Segmenter(std::set<std::string> ignored_tags) : ignored_tags_(std::move(ignored_tags)) {}

Position Segmenter::position_of(const std::string& tag) const {
    if (ignored_tags_.count(tag) == 0) {
        return Position::Current;
    }
    if (prefix_tags().count(tag) > 0) {
        return Position::Next;
    }
    return Position::Previous;
}

void Segmenter::segment(const pugi::xml_document& in, pugi::xml_document& out) const {
    out.reset(in);
    pugi::xml_node body = xml::require_body(out);

    std::map<std::string, int> ordinals;
    std::vector<pugi::xml_node> queue;
    std::string segment_type;
    std::string segment_n;
    Position position = kInitialPosition;
    std::size_t sealed = 0;

    for (const auto& child : snapshot_children(body)) {
        if (child.type() != pugi::node_element) {
            // Text travels with the element before it
            queue.push_back(child);
            continue;
        }
        std::string tag = xml::local_name(child);
        Position child_position = position_of(tag);
        if (opens_boundary(position, child_position)) {
            seal(body, queue, segment_type, segment_n);
            ++sealed;
            segment_type.clear();
            segment_n.clear();
        }
        if (child_position == Position::Current) {
            auto it = ordinals.find(tag);
            int ordinal = it == ordinals.end() ? 0 : it->second + 1;
            ordinals[tag] = ordinal;
            if (segment_type.empty()) {
                segment_type = tag;
                segment_n = std::to_string(ordinal);
            }
        }
        queue.push_back(child);
        position = child_position;
    }
    if (!queue.empty()) {
        seal(body, queue, segment_type, segment_n);
        ++sealed;
    }

    if (debug_) {
        std::cerr << "[collatio] segmented body into " << sealed << " segments" << std::endl;
    }
}

void Segmenter::desegment(const pugi::xml_document& in, pugi::xml_document& out) const {
    out.reset(in);
    pugi::xml_node body = xml::require_body(out);
    for (const auto& child : snapshot_children(body)) {
        if (!is_segment(child)) {
            continue;
        }
        for (const auto& grandchild : snapshot_children(child)) {
            body.insert_move_before(grandchild, child);
        }
        body.remove_child(child);
    }
}

void Segmenter::split_at_markers(const pugi::xml_document& in, pugi::xml_document& out) {
    out.reset(in);
    pugi::xml_node body = xml::require_body(out);
    std::vector<pugi::xml_node> queue;
    for (const auto& child : snapshot_children(body)) {
        if (is_segment_marker(child)) {
            seal(body, queue, "", "");
            body.remove_child(child);
            continue;
        }
        queue.push_back(child);
    }
    seal(body, queue, "", "");
}

std::vector<pugi::xml_node> Segmenter::segments(const pugi::xml_node& root) {
    std::vector<pugi::xml_node> result;
    for (const auto& child : xml::element_children(xml::require_body(root), "seg")) {
        if (is_segment(child)) {
            result.push_back(child);
        }
    }
    return result;
}

} // namespace collatio
