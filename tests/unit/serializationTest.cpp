#include <sectla/serialization.h>

#include <gtest/gtest.h>

using namespace Flint::WLA;
using namespace Flint::SectLA;

namespace {

Json::Value json(const std::string& _text) {
  return parseJsonText(_text, "test input");
}

const char* MINIMAL_ELEMENT = R"({
  "tag": "p", "domOrder": 4,
  "box": {"top": 10, "left": 20, "width": 300, "height": 40.5},
  "style": {}
})";

}  // namespace

TEST(SerializationTest, MinimalElementUsesDefaults) {
  auto Element = parseLayoutElement(json(MINIMAL_ELEMENT));
  EXPECT_EQ(Element.Tag, "p");
  EXPECT_EQ(Element.DomOrder, 4);
  EXPECT_EQ(Element.ParentDomOrder, NO_PARENT);
  EXPECT_FLOAT_EQ(Element.BoundingBox.top(), 10.f);
  EXPECT_FLOAT_EQ(Element.BoundingBox.left(), 20.f);
  EXPECT_FLOAT_EQ(Element.BoundingBox.height(), 40.5f);
  EXPECT_TRUE(Element.Style.Visible);
  EXPECT_TRUE(Element.Style.BorderWidth.isZero());
  EXPECT_FALSE(Element.hasContent());
}

TEST(SerializationTest, HasTextDefaultsToNonBlankText) {
  auto Element = json(MINIMAL_ELEMENT);
  Element["text"] = "  Welcome  ";
  EXPECT_TRUE(parseLayoutElement(Element).HasText);

  Element["text"] = " \n\t ";
  EXPECT_FALSE(parseLayoutElement(Element).HasText);

  Element["hasText"] = true;
  EXPECT_TRUE(parseLayoutElement(Element).HasText);
}

TEST(SerializationTest, EdgeNotations) {
  auto Element = json(MINIMAL_ELEMENT);
  Element["style"] = json(R"json({
    "backgroundColor": "rgb(1, 2, 3)",
    "borderWidth": "1px solid rgb(0, 0, 0)",
    "margin": 8,
    "padding": {"top": "4px", "left": 2},
    "visible": false
  })json");

  auto Style = parseLayoutElement(Element).Style;
  EXPECT_EQ(Style.BackgroundColor, "rgb(1, 2, 3)");
  EXPECT_FLOAT_EQ(Style.BorderWidth.Top, 1.f);
  EXPECT_FLOAT_EQ(Style.BorderWidth.Left, 1.f);
  EXPECT_FLOAT_EQ(Style.Margin.Bottom, 8.f);
  EXPECT_FLOAT_EQ(Style.Padding.Top, 4.f);
  EXPECT_FLOAT_EQ(Style.Padding.Right, 0.f);
  EXPECT_FLOAT_EQ(Style.Padding.Left, 2.f);
  EXPECT_FALSE(Style.Visible);
}

TEST(SerializationTest, MalformedElementsAreRejected) {
  auto WithoutBox = json(MINIMAL_ELEMENT);
  WithoutBox.removeMember("box");
  EXPECT_THROW(parseLayoutElement(WithoutBox), exInvalidLayoutData);

  auto WithoutStyle = json(MINIMAL_ELEMENT);
  WithoutStyle.removeMember("style");
  EXPECT_THROW(parseLayoutElement(WithoutStyle), exInvalidLayoutData);

  auto TextualWidth = json(MINIMAL_ELEMENT);
  TextualWidth["box"]["width"] = "wide";
  EXPECT_THROW(parseLayoutElement(TextualWidth), exInvalidLayoutData);

  auto WithoutOrder = json(MINIMAL_ELEMENT);
  WithoutOrder.removeMember("domOrder");
  EXPECT_THROW(parseLayoutElement(WithoutOrder), exInvalidLayoutData);

  auto BadBorder = json(MINIMAL_ELEMENT);
  BadBorder["style"]["borderWidth"] = "thin";
  EXPECT_THROW(parseLayoutElement(BadBorder), exInvalidLayoutData);

  EXPECT_THROW(parseLayoutElement(json("[]")), exInvalidLayoutData);
}

TEST(SerializationTest, Snapshot) {
  auto Snapshot = parseLayoutSnapshot(std::string(R"({
    "url": "https://example.com/",
    "page": {"width": 1280, "height": 2400},
    "elements": [
      {"tag": "header", "domOrder": 0, "box": {"top": 0, "left": 0, "width": 1280, "height": 80}, "style": {}},
      {"tag": "p", "domOrder": 1, "parentDomOrder": 0, "box": {"top": 10, "left": 0, "width": 400, "height": 40}, "style": {}, "text": "Hi"}
    ]
  })"));

  EXPECT_EQ(Snapshot.Url, "https://example.com/");
  EXPECT_FLOAT_EQ(Snapshot.PageSize.Width, 1280.f);
  ASSERT_EQ(Snapshot.Elements.size(), 2u);
  EXPECT_EQ(Snapshot.Elements[1]->ParentDomOrder, 0);
  EXPECT_EQ(Snapshot.Elements[1]->Text, "Hi");
}

TEST(SerializationTest, MalformedSnapshotsAreRejected) {
  EXPECT_THROW(parseLayoutSnapshot(std::string("{\"elements\": [")),
               exInvalidLayoutData);
  EXPECT_THROW(parseLayoutSnapshot(std::string("{}")), exInvalidLayoutData);
  EXPECT_THROW(parseLayoutSnapshot(std::string("{\"elements\": {}}")),
               exInvalidLayoutData);
  EXPECT_THROW(parseLayoutSnapshot(std::string(
                   "{\"page\": 5, \"elements\": []}")),
               exInvalidLayoutData);
  EXPECT_TRUE(
      parseLayoutSnapshot(std::string("{\"elements\": []}")).Elements.empty());
}

TEST(SerializationTest, DetectionOptionsOverrideDefaults) {
  auto Options = parseDetectionOptions(
      json(R"({"gapThresholdPx": 40, "heroMaxIndex": 2, "sidebarMaxWidthRatio": 0.25})"));
  EXPECT_FLOAT_EQ(Options.GapThresholdPx, 40.f);
  EXPECT_EQ(Options.HeroMaxIndex, 2u);
  EXPECT_FLOAT_EQ(Options.SidebarMaxWidthRatio, 0.25f);
  EXPECT_FLOAT_EQ(Options.MinHeightPx, DEFAULT_MIN_HEIGHT_PX);

  EXPECT_THROW(parseDetectionOptions(json(R"({"gapThreshold": 40})")),
               exInvalidLayoutData);
  EXPECT_THROW(parseDetectionOptions(json(R"({"minWidthPx": -1})")),
               exInvalidLayoutData);
  EXPECT_THROW(parseDetectionOptions(json(R"({"heroMaxIndex": -1})")),
               exInvalidLayoutData);
  EXPECT_THROW(parseDetectionOptions(json(R"({"minHeightPx": "30px"})")),
               exInvalidLayoutData);
}

TEST(SerializationTest, SectionsDocument) {
  stuSection Section;
  Section.ID = 1;
  Section.Type = enuSectionType::Hero;
  Section.Content = "Build faster";
  Section.BoundingBox = stuBoundingBox(100.f, 0.f, 1280.f, 420.f);
  Section.Metadata.HasImages = true;
  Section.Metadata.ElementCount = 1;
  Section.Html = "<section></section>";

  auto Document = sectionsToJson({Section}, "https://example.com/");
  EXPECT_EQ(Document["url"].asString(), "https://example.com/");
  EXPECT_EQ(Document["total_sections"].asUInt64(), 1u);
  const auto& First = Document["sections"][0];
  EXPECT_EQ(First["id"].asUInt64(), 1u);
  EXPECT_EQ(First["type"].asString(), "hero");
  EXPECT_EQ(First["content"].asString(), "Build faster");
  EXPECT_DOUBLE_EQ(First["bounds"]["top"].asDouble(), 100.);
  EXPECT_DOUBLE_EQ(First["bounds"]["width"].asDouble(), 1280.);
  EXPECT_TRUE(First["metadata"]["hasImages"].asBool());
  EXPECT_FALSE(First["metadata"]["hasVideos"].asBool());
  EXPECT_EQ(First["metadata"]["elementCount"].asUInt64(), 1u);
  EXPECT_EQ(First["html"].asString(), "<section></section>");

  EXPECT_FALSE(sectionsToJson(SectionVector_t()).isMember("url"));
  EXPECT_EQ(sectionsToJson(SectionVector_t())["sections"].size(), 0u);
}
