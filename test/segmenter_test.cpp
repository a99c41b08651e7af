#include <gtest/gtest.h>

#include "collatio/errors.h"
#include "collatio/segmenter.h"
#include "collatio/xml_utils.h"

using namespace collatio;

namespace {

void load(pugi::xml_document& doc, const std::string& body) {
    xml::load_string(doc, "<TEI><text><body>" + body + "</body></text></TEI>");
}

std::string body_of(const pugi::xml_document& doc) {
    return xml::serialize_children(xml::require_body(doc));
}

} // namespace

TEST(SegmenterTransitions, CurrentAfterCurrentOpensBoundary) {
    EXPECT_TRUE(opens_boundary(Position::Current, Position::Current));
}

TEST(SegmenterTransitions, CurrentAfterNextStaysInSegment) {
    EXPECT_FALSE(opens_boundary(Position::Next, Position::Current));
}

TEST(SegmenterTransitions, CurrentAfterPreviousOpensBoundary) {
    EXPECT_TRUE(opens_boundary(Position::Previous, Position::Current));
}

TEST(SegmenterTransitions, PreviousAttachesBackwards) {
    EXPECT_FALSE(opens_boundary(Position::Current, Position::Previous));
    EXPECT_FALSE(opens_boundary(Position::Previous, Position::Previous));
    EXPECT_FALSE(opens_boundary(Position::Next, Position::Previous));
}

TEST(SegmenterTransitions, NextOpensAfterCurrentOrPrevious) {
    EXPECT_TRUE(opens_boundary(Position::Current, Position::Next));
    EXPECT_TRUE(opens_boundary(Position::Previous, Position::Next));
    EXPECT_FALSE(opens_boundary(Position::Next, Position::Next));
}

TEST(SegmenterTransitions, InitialStateAbsorbsLeadingElements) {
    EXPECT_EQ(kInitialPosition, Position::Next);
    EXPECT_FALSE(opens_boundary(kInitialPosition, Position::Current));
    EXPECT_FALSE(opens_boundary(kInitialPosition, Position::Next));
}

TEST(SegmenterPositions, ClassifiesTags) {
    Segmenter segmenter({"divGen", "pb"});
    EXPECT_EQ(segmenter.position_of("w"), Position::Current);
    EXPECT_EQ(segmenter.position_of("pb"), Position::Previous);
    EXPECT_EQ(segmenter.position_of("divGen"), Position::Next);

    Segmenter plain({});
    EXPECT_EQ(plain.position_of("divGen"), Position::Current);
}

TEST(Segmenter, AnchorsEachSegmentOnOneSubstantiveElement) {
    pugi::xml_document doc;
    load(doc, "<divGen type=\"verse\" n=\"1\"/><w>a</w><pb/><w>b</w><w>c</w>");
    Segmenter segmenter({"divGen", "pb"});
    pugi::xml_document out;
    segmenter.segment(doc, out);

    std::vector<pugi::xml_node> segments = Segmenter::segments(out);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_STREQ(segments[0].attribute("type").value(), "w");
    EXPECT_STREQ(segments[0].attribute("n").value(), "0");
    EXPECT_EQ(xml::serialize_children(segments[0]), "<divGen type=\"verse\" n=\"1\" /><w>a</w><pb />");
    EXPECT_STREQ(segments[1].attribute("n").value(), "1");
    EXPECT_EQ(xml::serialize_children(segments[1]), "<w>b</w>");
    EXPECT_STREQ(segments[2].attribute("n").value(), "2");
    for (const auto& seg : segments) {
        EXPECT_STREQ(seg.attribute("function").value(), kSegmentFunction);
    }
}

TEST(Segmenter, SegmentWithoutSubstantiveElementIsUntyped) {
    pugi::xml_document doc;
    load(doc, "<pb/>");
    Segmenter segmenter({"pb"});
    pugi::xml_document out;
    segmenter.segment(doc, out);

    std::vector<pugi::xml_node> segments = Segmenter::segments(out);
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_FALSE(segments[0].attribute("type"));
    EXPECT_FALSE(segments[0].attribute("n"));
}

TEST(Segmenter, InputIsNotModified) {
    pugi::xml_document doc;
    load(doc, "<w>a</w><w>b</w>");
    Segmenter segmenter({});
    pugi::xml_document out;
    segmenter.segment(doc, out);
    EXPECT_EQ(body_of(doc), "<w>a</w><w>b</w>");
}

TEST(Segmenter, DesegmentRestoresBody) {
    const std::string body =
        "<divGen type=\"chapter\" n=\"B01K1\"/><divGen type=\"verse\" n=\"B01K1V1\"/>"
        "<w>a</w><pc>.</pc><pb n=\"2\"/><w>b</w>tail<lb/><app><lem><w>c</w></lem></app>";
    pugi::xml_document doc;
    load(doc, body);
    Segmenter segmenter({"divGen", "pb", "lb"});
    pugi::xml_document segmented;
    pugi::xml_document restored;
    segmenter.segment(doc, segmented);
    segmenter.desegment(segmented, restored);
    EXPECT_EQ(body_of(restored), body_of(doc));
}

TEST(Segmenter, DesegmentKeepsOtherSegElements) {
    pugi::xml_document doc;
    load(doc, "<seg type=\"foreign\"><w>a</w></seg>");
    Segmenter segmenter({});
    pugi::xml_document out;
    segmenter.desegment(doc, out);
    EXPECT_EQ(body_of(out), "<seg type=\"foreign\"><w>a</w></seg>");
}

TEST(Segmenter, SplitAtMarkersConsumesMarkers) {
    pugi::xml_document doc;
    load(doc, "<w>a</w><divGen type=\"seg\"/><w>b</w><w>c</w><divGen type=\"seg\"/>");
    pugi::xml_document out;
    Segmenter::split_at_markers(doc, out);

    std::vector<pugi::xml_node> segments = Segmenter::segments(out);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(xml::serialize_children(segments[0]), "<w>a</w>");
    EXPECT_EQ(xml::serialize_children(segments[1]), "<w>b</w><w>c</w>");
    EXPECT_EQ(xml::serialize_children(segments[2]), "");
}

TEST(Segmenter, RequiresBody) {
    pugi::xml_document doc;
    xml::load_string(doc, "<TEI><teiHeader/></TEI>");
    Segmenter segmenter({});
    pugi::xml_document out;
    EXPECT_THROW(segmenter.segment(doc, out), StructuralViolation);
}
