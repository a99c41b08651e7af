#include "collatio/normalizer.h"
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
            std::cerr << "Usage: collatio-normalize [--accent=cantillation,pointing,extraordinaire] "
                         "[--punctuation=05C0,...] [--reading=ketiv|qere] [--tag=pb,cb,lb] [--output=file] input.xml"
                      << std::endl;
            return 1;
        }
        const std::string& input = settings.inputs.front();

        Normalizer normalizer(make_normalizer_config(settings));
        normalizer.set_debug(settings.debug);

        pugi::xml_document doc;
        xml::load_document(doc, input);
        pugi::xml_document normalized;
        normalizer.normalize(doc, normalized);

        std::string outfile = settings.output_for(input, "_normalized");
        xml::save_document(normalized, outfile);

        if (settings.verbose) {
            std::cout << "Normalized " << input << " to " << outfile << std::endl;
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
