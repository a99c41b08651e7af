#include "collatio/alignment.h"
#include "collatio/collator.h"
#include "collatio/normalizer.h"
#include "collatio/settings.h"
#include "collatio/xml_utils.h"

#include <fstream>
#include <iostream>
#include <stdexcept>

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

        if (settings.inputs.size() < 2) {
            std::cerr << "Usage: collatio-collate [--accent=...] [--tag=...] [--level=verse] "
                         "[--export=requests.json] [--alignment=aligned.json] [--output=collation.xml] "
                         "lemma.xml witness.xml..."
                      << std::endl;
            return 1;
        }

        NormalizerConfig config = make_normalizer_config(settings);
        config.preferred_reading.clear();
        Collator collator(config, settings.level);
        collator.set_debug(settings.debug);

        for (const auto& input : settings.inputs) {
            if (settings.verbose) {
                std::cerr << "Reading " << input << std::endl;
            }
            pugi::xml_document transcription;
            xml::load_document(transcription, input);
            collator.read_witness(transcription);
        }

        const std::string export_file = settings.get("export");
        if (!export_file.empty()) {
            std::ofstream out(export_file);
            if (!out) {
                throw std::runtime_error("Failed to open file for writing: " + export_file);
            }
            out << collator.export_requests().dump(2) << std::endl;
            if (settings.verbose) {
                std::cout << collator.divisions().size() << " alignment requests written to " << export_file
                          << std::endl;
            }
        }

        const std::string alignment_file = settings.get("alignment");
        if (alignment_file.empty()) {
            if (!export_file.empty()) {
                return 0;
            }
            std::cerr << "No alignment specified (--alignment=... or --export=...)" << std::endl;
            return 1;
        }

        auto engine = RecordedAlignment::load(alignment_file);
        collator.collate(*engine);
        collator.augment_lemma();

        std::string outfile = settings.output.empty() ? "collation.xml" : settings.output;
        xml::save_document(collator.lemma_document(), outfile);

        if (settings.verbose) {
            std::cout << collator.witnesses().size() << " witnesses collated against "
                      << collator.lemma_witness() << " into " << outfile << std::endl;
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
