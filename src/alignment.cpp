#include "collatio/alignment.h"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace collatio {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

RecordedAlignment::RecordedAlignment(nlohmann::json outputs) : outputs_(std::move(outputs)) {
    if (!outputs_.is_object()) {
        throw std::runtime_error("Recorded alignment must be a JSON object keyed by division");
    }
}

std::unique_ptr<RecordedAlignment> RecordedAlignment::load(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open alignment file: " + path);
    }
    nlohmann::json outputs;
    try {
        input >> outputs;
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Failed to parse alignment file " + path + ": " + ex.what());
    }
    return std::make_unique<RecordedAlignment>(std::move(outputs));
}

std::string RecordedAlignment::align(const std::string& division, const nlohmann::json& /*request*/) {
    auto it = outputs_.find(division);
    if (it == outputs_.end()) {
        throw std::runtime_error("No recorded alignment for division " + division);
    }
    return it->get<std::string>();
}

nlohmann::json alignment_request(const std::vector<Witness>& witnesses, const std::string& division) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& witness : witnesses) {
        const TokenList* tokens = witness.tokens_for(division);
        if (!tokens) {
            continue;
        }
        nlohmann::json token_array = nlohmann::json::array();
        for (const auto& token : *tokens) {
            token_array.push_back({{"t", token.t}, {"n", token.n}});
        }
        entries.push_back({{"id", witness.id}, {"tokens", token_array}});
    }
    nlohmann::json request;
    request["witnesses"] = entries;
    return request;
}

std::string unescape_markup(const std::string& text) {
    std::string result = text;
    replace_all(result, "&lt;", "<");
    replace_all(result, "&gt;", ">");
    replace_all(result, "&quot;", "\"");
    return result;
}

} // namespace collatio
