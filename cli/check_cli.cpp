#include "collatio/checks.h"
#include "collatio/settings.h"
#include "collatio/xml_utils.h"

#include <iostream>

using namespace collatio;

int main(int argc, char** argv) {
    try {
        Settings settings = parse_arguments(argc, argv);
        if (settings.inputs.empty()) {
            std::cerr << "Usage: collatio-check [--check=unpointed|holam] input.xml..." << std::endl;
            return 1;
        }

        const std::string check = settings.get("check", "unpointed");
        if (check != "unpointed" && check != "holam") {
            std::cerr << "Unknown check: " << check << " (expected unpointed or holam)" << std::endl;
            return 1;
        }

        for (const auto& input : settings.inputs) {
            pugi::xml_document doc;
            xml::load_document(doc, input);
            if (check == "unpointed") {
                for (const auto& finding : find_unpointed_words(doc)) {
                    std::cout << "Unpointed word " << finding.word << " in div " << finding.division << std::endl;
                }
            } else {
                for (const auto& finding : find_invalid_holam(doc)) {
                    std::cout << "Invalid holam haser found at word " << finding.word << " in div "
                              << finding.division << std::endl;
                }
            }
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
