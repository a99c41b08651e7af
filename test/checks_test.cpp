#include <gtest/gtest.h>

#include "collatio/checks.h"
#include "collatio/xml_utils.h"

using namespace collatio;

namespace {

void load(pugi::xml_document& doc, const std::string& body) {
    xml::load_string(doc, "<TEI><text><body>" + body + "</body></text></TEI>");
}

} // namespace

TEST(Checks, UnpointedWords) {
    pugi::xml_document doc;
    load(doc,
         "<w>ראשית</w>"
         "<divGen type=\"verse\" n=\"B01K1V1\"/><w>כי</w><w>כִּי</w><w>כ֖י</w>"
         "<milestone unit=\"verse\" n=\"B01K1V2\"/><w>טוב</w><pc>׃</pc>");
    std::vector<Finding> findings = find_unpointed_words(doc);
    ASSERT_EQ(findings.size(), 3u);
    EXPECT_EQ(findings[0].word, "ראשית");
    EXPECT_EQ(findings[0].division, "");
    EXPECT_EQ(findings[1].word, "כי");
    EXPECT_EQ(findings[1].division, "B01K1V1");
    EXPECT_EQ(findings[2].word, "טוב");
    EXPECT_EQ(findings[2].division, "B01K1V2");
}

TEST(Checks, InvalidHolam) {
    pugi::xml_document doc;
    load(doc,
         "<divGen type=\"verse\" n=\"B02K20V6\"/>"
         "<w>מִצְוֺתָי</w><w>חֺק</w><w>חֹק</w>");
    std::vector<Finding> findings = find_invalid_holam(doc);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].word, "חֺק");
    EXPECT_EQ(findings[0].division, "B02K20V6");
}

TEST(Checks, RequiresBody) {
    pugi::xml_document doc;
    xml::load_string(doc, "<TEI/>");
    EXPECT_THROW(find_unpointed_words(doc), std::runtime_error);
}
