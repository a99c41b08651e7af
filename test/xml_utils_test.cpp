#include <gtest/gtest.h>

#include "collatio/errors.h"
#include "collatio/xml_utils.h"

using namespace collatio;

TEST(XmlUtils, PrefixedNames) {
    pugi::xml_document doc;
    xml::load_string(doc, "<tei:TEI xmlns:tei=\"http://www.tei-c.org/ns/1.0\"><tei:text><tei:body>"
                          "<tei:app/></tei:body></tei:text></tei:TEI>");
    pugi::xml_node body = xml::require_body(doc);
    EXPECT_EQ(xml::local_name(body), "body");
    EXPECT_EQ(xml::element_name(body, "seg"), "tei:seg");
    EXPECT_TRUE(xml::is_element(body.first_child(), "app"));
    EXPECT_EQ(xml::descendants(doc, "app").size(), 1u);
}

TEST(XmlUtils, WitnessReferences) {
    pugi::xml_document doc;
    xml::load_string(doc, "<rdg wit=\"#A  #B-qere C\"/>");
    pugi::xml_node rdg = doc.document_element();
    EXPECT_EQ(xml::witness_references(rdg), (std::vector<std::string>{"A", "B-qere", "C"}));
    EXPECT_TRUE(xml::cites_witness(rdg, "B-qere"));
    EXPECT_FALSE(xml::cites_witness(rdg, "B"));
}

TEST(XmlUtils, AppendTextMerges) {
    pugi::xml_document doc;
    pugi::xml_node w = doc.append_child("w");
    xml::append_text(w, "ab");
    xml::append_text(w, "");
    xml::append_text(w, "cd");
    EXPECT_EQ(xml::serialize(w), "<w>abcd</w>");
    EXPECT_FALSE(w.first_child().next_sibling());
}

TEST(XmlUtils, DivisionMarkers) {
    pugi::xml_document doc;
    xml::load_string(doc, "<body><divGen type=\"verse\"/><milestone unit=\"chapter\"/><divGen/><pb/></body>");
    std::vector<pugi::xml_node> children = xml::element_children(doc.document_element());
    EXPECT_EQ(xml::division_type(children[0]), "verse");
    EXPECT_EQ(xml::division_type(children[1]), "chapter");
    EXPECT_FALSE(xml::is_division_marker(children[2]));
    EXPECT_FALSE(xml::is_division_marker(children[3]));
}

TEST(XmlUtils, IdFallsBackToPlainId) {
    pugi::xml_document doc;
    xml::load_string(doc, "<listWit><witness xml:id=\"A\"/><witness id=\"B\"/></listWit>");
    std::vector<pugi::xml_node> witnesses = xml::element_children(doc.document_element(), "witness");
    EXPECT_EQ(xml::id_of(witnesses[0]), "A");
    EXPECT_EQ(xml::id_of(witnesses[1]), "B");
}

TEST(XmlUtils, ParseErrors) {
    pugi::xml_document doc;
    EXPECT_THROW(xml::load_string(doc, "<TEI>"), std::runtime_error);
    EXPECT_THROW(xml::load_document(doc, "/nonexistent/file.xml"), std::runtime_error);
    xml::load_string(doc, "<TEI/>");
    EXPECT_THROW(xml::require_body(doc), StructuralViolation);
}
