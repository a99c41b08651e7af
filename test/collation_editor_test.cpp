#include <gtest/gtest.h>

#include "collatio/collation_editor.h"
#include "collatio/errors.h"
#include "collatio/xml_utils.h"

using namespace collatio;

namespace {

const char* kHeader =
    "<teiHeader><fileDesc><sourceDesc><listWit>"
    "<witness xml:id=\"A\"/><witness xml:id=\"B\"/><witness xml:id=\"C\"/>"
    "</listWit></sourceDesc></fileDesc></teiHeader>";

void load(pugi::xml_document& doc, const std::string& body) {
    xml::load_string(doc, std::string("<TEI>") + kHeader + "<text><body>" + body + "</body></text></TEI>");
}

std::string body_of(const pugi::xml_document& doc) {
    return xml::serialize_children(xml::require_body(doc));
}

const char* kResegmented =
    "<w>x</w>"
    "<app n=\"1\">"
    "<lem><w>a</w><divGen type=\"seg\"/><w>b</w></lem>"
    "<rdg wit=\"#A #B\"><w>a</w><divGen type=\"seg\"/><w>b2</w></rdg>"
    "<rdg wit=\"#C\"><w>a</w><divGen type=\"seg\"/><w>b</w></rdg>"
    "</app>"
    "<w>y</w>";

} // namespace

TEST(CollationEditorValidate, EqualCountsReportNothing) {
    pugi::xml_document doc;
    load(doc, kResegmented);
    EXPECT_TRUE(CollationEditor().validate(doc).empty());
}

TEST(CollationEditorValidate, ReportsEveryMismatchedReading) {
    pugi::xml_document doc;
    load(doc,
         "<app n=\"1\"><lem><w>a</w><divGen type=\"seg\"/><w>b</w></lem>"
         "<rdg wit=\"#A\"><w>a</w><divGen type=\"seg\"/><w>b</w></rdg></app>"
         "<app n=\"2\"><lem><w>c</w><divGen type=\"seg\"/><w>d</w></lem>"
         "<rdg wit=\"#B\"><w>c</w><divGen type=\"seg\"/><w>d</w><divGen type=\"seg\"/></rdg>"
         "<rdg wit=\"#C\"><w>c</w><w>d</w></rdg></app>");
    std::vector<SegmentMismatch> mismatches = CollationEditor().validate(doc);
    ASSERT_EQ(mismatches.size(), 2u);
    EXPECT_EQ(mismatches[0].app, "2");
    EXPECT_EQ(mismatches[0].witnesses, "#B");
    EXPECT_EQ(mismatches[0].lemma_count, 1u);
    EXPECT_EQ(mismatches[0].reading_count, 2u);
    EXPECT_EQ(mismatches[1].witnesses, "#C");
    EXPECT_EQ(mismatches[1].reading_count, 0u);
    EXPECT_NE(mismatches[0].describe().find("with index 2"), std::string::npos);
}

TEST(CollationEditorValidate, MissingLemIsStructural) {
    pugi::xml_document doc;
    load(doc, "<app><rdg wit=\"#A\"><w>a</w></rdg></app>");
    EXPECT_THROW(CollationEditor().validate(doc), StructuralViolation);
}

TEST(CollationEditor, GetWitnesses) {
    pugi::xml_document doc;
    load(doc, "<w>a</w>");
    EXPECT_EQ(CollationEditor().get_witnesses(doc), (std::vector<std::string>{"A", "B", "C"}));

    pugi::xml_document bare;
    xml::load_string(bare, "<TEI><text><body/></text></TEI>");
    EXPECT_THROW(CollationEditor().get_witnesses(bare), StructuralViolation);
}

TEST(CollationEditor, LemmaProjection) {
    pugi::xml_document doc;
    load(doc, kResegmented);
    pugi::xml_document out;
    CollationEditor().get_lemma_xml(doc, out);
    EXPECT_EQ(body_of(out), "<w>x</w><w>a</w><divGen type=\"seg\" /><w>b</w><w>y</w>");
}

TEST(CollationEditor, WitnessProjection) {
    pugi::xml_document doc;
    load(doc, kResegmented);
    pugi::xml_document out;
    CollationEditor().get_witness_xml(doc, "B", out);
    EXPECT_EQ(body_of(out), "<w>x</w><w>a</w><divGen type=\"seg\" /><w>b2</w><w>y</w>");
}

TEST(CollationEditor, WitnessWithoutReading) {
    pugi::xml_document doc;
    load(doc, kResegmented);
    pugi::xml_document out;
    EXPECT_THROW(CollationEditor().get_witness_xml(doc, "D", out), UnknownWitnessMembership);
}

TEST(CollationEditor, WitnessWithTwoReadings) {
    pugi::xml_document doc;
    load(doc, "<app><lem><w>a</w></lem><rdg wit=\"#A\"><w>a</w></rdg><rdg wit=\"#B #A\"><w>b</w></rdg></app>");
    pugi::xml_document out;
    EXPECT_THROW(CollationEditor().get_witness_xml(doc, "A", out), AmbiguousWitnessMembership);
}

TEST(CollationEditorUpdate, IdenticalWitnessesLeaveNoApparatus) {
    pugi::xml_document doc;
    load(doc,
         "<app><lem><w>a</w><divGen type=\"seg\"/><w>b</w></lem>"
         "<rdg wit=\"#A #B #C\"><w>a</w><divGen type=\"seg\"/><w>b</w></rdg></app>");
    pugi::xml_document out;
    CollationEditor().update_boundaries(doc, out);
    EXPECT_EQ(body_of(out), "<w>a</w><w>b</w>");
}

TEST(CollationEditorUpdate, OutlierGetsItsOwnReading) {
    pugi::xml_document doc;
    load(doc, kResegmented);
    pugi::xml_document out;
    CollationEditor().update_boundaries(doc, out);
    EXPECT_EQ(body_of(out),
              "<w>x</w><w>a</w>"
              "<app><lem><w>b</w><w>y</w></lem>"
              "<rdg wit=\"#A #B\"><w>b2</w><w>y</w></rdg>"
              "<rdg wit=\"#C\"><w>b</w><w>y</w></rdg></app>");

    pugi::xml_node app = xml::first_descendant(out, "app");
    EXPECT_EQ(xml::element_children(app, "rdg").size(), 2u);
    EXPECT_TRUE(xml::first_descendant(out, "listWit"));
}

TEST(CollationEditorUpdate, InputIsNotModified) {
    pugi::xml_document doc;
    load(doc, kResegmented);
    std::string before = body_of(doc);
    pugi::xml_document out;
    CollationEditor().update_boundaries(doc, out);
    EXPECT_EQ(body_of(doc), before);
}

TEST(CollationEditorUpdate, RejectsMismatchedSegmentation) {
    pugi::xml_document doc;
    load(doc,
         "<app n=\"7\"><lem><w>a</w><divGen type=\"seg\"/><w>b</w></lem>"
         "<rdg wit=\"#A #B #C\"><w>a</w><w>b</w></rdg></app>");
    pugi::xml_document out;
    try {
        CollationEditor().update_boundaries(doc, out);
        FAIL() << "expected ResegmentationMismatch";
    } catch (const ResegmentationMismatch& ex) {
        ASSERT_EQ(ex.mismatches().size(), 1u);
        EXPECT_EQ(ex.mismatches()[0].app, "7");
    }
}
