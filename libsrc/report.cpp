#include "report.h"

#include <sstream>
#include <utility>
#include <vector>

namespace Flint {
namespace SectLA {

using namespace Flint::WLA;

namespace {

std::string trim(const std::string &_text) {
  const char *Whitespace = " \t\r\n\f\v";
  auto First = _text.find_first_not_of(Whitespace);
  if (First == std::string::npos) return std::string();
  auto Last = _text.find_last_not_of(Whitespace);
  return _text.substr(First, Last - First + 1);
}

}  // namespace

std::string formatSectionsAsText(const SectionVector_t &_sections) {
  std::ostringstream Stream;
  Stream << "Found " << _sections.size() << " sections:\n\n";

  // Counts per type in the order types first appear
  std::vector<std::pair<enuSectionType, size_t>> TypeCounts;
  for (const auto &Section : _sections) {
    const auto &Bounds = Section.BoundingBox;
    Stream << "   Section " << Section.ID << " (" << toString(Section.Type)
           << "):\n"
           << "   Content: "
           << utf8Prefix(Section.Content, REPORT_CONTENT_PREVIEW_LENGTH)
           << "...\n"
           << "   Layout: " << Bounds.width() << "x" << Bounds.height()
           << " at (" << Bounds.left() << ", " << Bounds.top() << ")\n"
           << "   Elements: " << Section.Metadata.ElementCount << "\n"
           << "   Images: " << (Section.Metadata.HasImages ? "Yes" : "No")
           << "\n"
           << "   Videos: " << (Section.Metadata.HasVideos ? "Yes" : "No")
           << "\n\n";

    bool Counted = false;
    for (auto &TypeCount : TypeCounts)
      if (TypeCount.first == Section.Type) {
        ++TypeCount.second;
        Counted = true;
        break;
      }
    if (Counted == false) TypeCounts.emplace_back(Section.Type, 1);
  }

  Stream << "Summary:\n";
  for (const auto &TypeCount : TypeCounts)
    Stream << "   " << toString(TypeCount.first) << ": " << TypeCount.second
           << "\n";
  return Stream.str();
}

std::string sectionFileName(const stuSection &_section) {
  return "section_" + std::to_string(_section.ID) + "_" +
         toString(_section.Type) + ".html";
}

std::string sectionHtmlDocument(const stuSection &_section) {
  if (_section.HtmlElements.empty()) return std::string();

  std::ostringstream Stream;
  Stream << "<div class=\"section section-" << toString(_section.Type)
         << "\" data-section-id=\"" << _section.ID << "\">\n";
  for (const auto &Html : _section.HtmlElements) {
    std::istringstream Lines(Html);
    std::string Line;
    while (std::getline(Lines, Line)) {
      Line = trim(Line);
      if (Line.empty()) continue;
      Stream << "  " << Line << "\n";
    }
  }
  Stream << "</div>";
  return Stream.str();
}

}  // namespace SectLA
}  // namespace Flint
