#include <sectla/report.h>

#include <gtest/gtest.h>

using namespace Flint::WLA;
using namespace Flint::SectLA;

namespace {

stuSection makeSection(size_t _id, enuSectionType _type,
                       const std::string& _content) {
  stuSection Section;
  Section.ID = _id;
  Section.Type = _type;
  Section.Content = _content;
  Section.BoundingBox = stuBoundingBox(80.f, 0.f, 1280.f, 420.f);
  Section.Metadata.ElementCount = 2;
  Section.Metadata.HasImages = true;
  return Section;
}

}  // namespace

TEST(ReportTest, TextListing) {
  SectionVector_t Sections{
      makeSection(1, enuSectionType::Header, "Acme"),
      makeSection(2, enuSectionType::Content, std::string(150, 'a')),
      makeSection(3, enuSectionType::Section, "Misc"),
      makeSection(4, enuSectionType::Content, "More")};

  auto Text = formatSectionsAsText(Sections);
  EXPECT_EQ(Text.rfind("Found 4 sections:\n\n", 0), 0u);
  EXPECT_NE(Text.find("   Section 1 (header):\n   Content: Acme...\n"
                      "   Layout: 1280x420 at (0, 80)\n   Elements: 2\n"
                      "   Images: Yes\n   Videos: No\n"),
            std::string::npos);
  EXPECT_NE(Text.find("   Content: " + std::string(100, 'a') + "...\n"),
            std::string::npos);
  EXPECT_EQ(Text.find(std::string(101, 'a')), std::string::npos);

  auto Summary = Text.substr(Text.find("Summary:\n"));
  EXPECT_EQ(Summary,
            "Summary:\n   header: 1\n   content: 2\n   section: 1\n");
}

TEST(ReportTest, EmptyListing) {
  EXPECT_EQ(formatSectionsAsText(SectionVector_t()),
            "Found 0 sections:\n\nSummary:\n");
}

TEST(ReportTest, HtmlFileNameAndDocument) {
  auto Section = makeSection(3, enuSectionType::Footer, "Copyright");
  EXPECT_EQ(sectionFileName(Section), "section_3_footer.html");
  EXPECT_EQ(sectionHtmlDocument(Section), "");

  Section.HtmlElements = {"<footer>\n    <p>Copyright</p>\n</footer>\n",
                          "  <small>Terms</small>  "};
  EXPECT_EQ(sectionHtmlDocument(Section),
            "<div class=\"section section-footer\" data-section-id=\"3\">\n"
            "  <footer>\n"
            "  <p>Copyright</p>\n"
            "  </footer>\n"
            "  <small>Terms</small>\n"
            "</div>");
}

TEST(ReportTest, PreviewKeepsMultiByteCharactersWhole) {
  std::string Accented;
  for (int i = 0; i < 150; ++i) Accented += "\xC3\xA9";
  auto Text = formatSectionsAsText(
      {makeSection(1, enuSectionType::Content, "a" + Accented)});

  std::string Expected = "a";
  for (int i = 0; i < 99; ++i) Expected += "\xC3\xA9";
  EXPECT_NE(Text.find("   Content: " + Expected + "...\n"), std::string::npos);
}
