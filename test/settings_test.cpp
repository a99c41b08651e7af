#include <gtest/gtest.h>

#include "collatio/settings.h"

#include <fstream>

using namespace collatio;

namespace {

Settings parse(std::vector<std::string> args) {
    args.insert(args.begin(), "collatio");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    return parse_arguments(static_cast<int>(argv.size()), argv.data());
}

std::string write_settings_file() {
    std::string path = ::testing::TempDir() + "collatio_settings.xml";
    std::ofstream out(path);
    out << "<collatio level=\"verse\" accent=\"cantillation\">"
           "<profiles>"
           "<item id=\"wlc\" tag=\"pb,lb\" reading=\"qere\"/>"
           "<item id=\"chapters\" level=\"chapter\" restriction=\"//profiles\"/>"
           "</profiles>"
           "</collatio>";
    return path;
}

} // namespace

TEST(Settings, ParsesOptionsAndInputs) {
    Settings settings = parse({"--accent=cantillation,pointing", "--tag=pb", "--reading=qere", "--output=out.xml",
                               "--verbose", "in.xml", "other.xml"});
    EXPECT_EQ(settings.accents, (std::vector<std::string>{"cantillation", "pointing"}));
    EXPECT_EQ(settings.tags, (std::vector<std::string>{"pb"}));
    EXPECT_EQ(settings.inputs, (std::vector<std::string>{"in.xml", "other.xml"}));
    EXPECT_EQ(settings.reading, "qere");
    EXPECT_EQ(settings.output, "out.xml");
    EXPECT_TRUE(settings.verbose);
    EXPECT_FALSE(settings.debug);
    EXPECT_EQ(settings.level, "verse");
}

TEST(Settings, ListOptionsAccumulate) {
    Settings settings = parse({"--tag=pb", "--tag=lb cb", "--tag=pb"});
    EXPECT_EQ(settings.tags, (std::vector<std::string>{"pb", "lb", "cb"}));
    EXPECT_EQ(settings.get("tag"), "pb,lb cb,pb");
}

TEST(Settings, TypedAccessors) {
    Settings settings = parse({"--count=12", "--flag=yes", "--off=0"});
    EXPECT_TRUE(settings.get_bool("flag", false));
    EXPECT_FALSE(settings.get_bool("off", true));
    EXPECT_TRUE(settings.get_bool("missing", true));
    EXPECT_TRUE(settings.has("count"));
    EXPECT_FALSE(settings.has("missing"));
    EXPECT_EQ(settings.get("missing", "fallback"), "fallback");
}

TEST(Settings, SwitchesReadAsBooleans) {
    Settings settings = parse({"--verbose=no", "--debug=true"});
    EXPECT_FALSE(settings.verbose);
    EXPECT_TRUE(settings.debug);

    settings = parse({"--verbose", "--debug=0"});
    EXPECT_TRUE(settings.verbose);
    EXPECT_FALSE(settings.debug);
}

TEST(Settings, OutputForInput) {
    Settings settings;
    EXPECT_EQ(settings.output_for("numbers.xml", "_normalized"), "numbers_normalized.xml");
    EXPECT_EQ(settings.output_for("numbers", "_finalized"), "numbers_finalized.xml");
    settings.output = "custom.xml";
    EXPECT_EQ(settings.output_for("numbers.xml", "_normalized"), "custom.xml");
}

TEST(Settings, ProfileByIdDoesNotOverrideCommandLine) {
    std::string path = write_settings_file();
    Settings base = parse({"--settings=" + path, "--profile=wlc", "--reading=ketiv"});
    Settings settings = load_settings(base);
    EXPECT_EQ(settings.reading, "ketiv");
    EXPECT_EQ(settings.tags, (std::vector<std::string>{"pb", "lb"}));
    EXPECT_EQ(settings.accents, (std::vector<std::string>{"cantillation"}));
    EXPECT_EQ(settings.level, "verse");
}

TEST(Settings, ProfileByRestriction) {
    std::string path = write_settings_file();
    Settings base = parse({"--settings=" + path});
    Settings settings = load_settings(base);
    // the first item has no restriction
    EXPECT_EQ(settings.reading, "qere");

    Settings chapters = load_settings(parse({"--settings=" + path, "--profile=chapters"}));
    EXPECT_EQ(chapters.level, "chapter");
}

TEST(Settings, UnknownProfile) {
    std::string path = write_settings_file();
    EXPECT_THROW(load_settings(parse({"--settings=" + path, "--profile=none"})), std::runtime_error);
}

TEST(Settings, MissingSettingsFile) {
    EXPECT_THROW(load_settings(parse({"--settings=/nonexistent/collatio.xml"})), std::runtime_error);
}
