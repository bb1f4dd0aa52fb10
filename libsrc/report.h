#ifndef __FLINT_SECTLA_REPORT__
#define __FLINT_SECTLA_REPORT__

#include <string>

#include "wla.h"

namespace Flint {
namespace SectLA {

constexpr size_t REPORT_CONTENT_PREVIEW_LENGTH = 100;

/// Human readable listing of the sections followed by a per-type summary.
std::string formatSectionsAsText(const Flint::WLA::SectionVector_t &_sections);

/// `section_<id>_<type>.html`
std::string sectionFileName(const Flint::WLA::stuSection &_section);

/// Member markup wrapped in a `div.section` container, one trimmed member per
/// line indented one level.
std::string sectionHtmlDocument(const Flint::WLA::stuSection &_section);

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_REPORT__
