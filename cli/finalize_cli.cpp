#include "collatio/collation_editor.h"
#include "collatio/labeler.h"
#include "collatio/settings.h"
#include "collatio/xml_utils.h"

#include <iostream>

using namespace collatio;

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        Settings settings;

        if (!cli_settings.settings_file.empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }

        if (settings.inputs.size() != 1) {
            std::cerr << "Usage: collatio-finalize [--output=file] collation.xml" << std::endl;
            return 1;
        }
        const std::string& input = settings.inputs.front();

        pugi::xml_document doc;
        xml::load_document(doc, input);

        CollationEditor editor;
        editor.set_debug(settings.debug);
        Labeler labeler;
        labeler.set_debug(settings.debug);

        if (settings.verbose) {
            std::cout << "Validating resegmentation of " << input << "..." << std::endl;
        }
        std::vector<SegmentMismatch> mismatches = editor.validate(doc);
        if (!mismatches.empty()) {
            for (const auto& mismatch : mismatches) {
                std::cerr << mismatch.describe() << std::endl;
            }
            std::cerr << "Resegmentation is not valid" << std::endl;
            return 1;
        }

        if (settings.verbose) {
            std::cout << "Updating apparatus boundaries..." << std::endl;
        }
        pugi::xml_document updated;
        editor.update_boundaries(doc, updated);

        if (settings.verbose) {
            std::cout << "Labeling apparatus elements..." << std::endl;
        }
        labeler.label(updated);

        std::string outfile = settings.output_for(input, "_finalized");
        xml::save_document(updated, outfile);
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
