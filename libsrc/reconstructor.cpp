#include "reconstructor.h"

#include <algorithm>

#include "algorithm.hpp"

namespace Flint {
namespace SectLA {

using namespace Flint::WLA;
using namespace Flint::Common;

stuSection reconstructSection(size_t _id, const stuSectionCandidate &_candidate,
                              enuSectionType _type) {
  stuSection Section;
  Section.ID = _id;
  Section.Type = _type;
  Section.BoundingBox = _candidate.Elements.front()->BoundingBox;
  for (const auto &Element : _candidate.Elements)
    Section.BoundingBox.unionWith_(Element->BoundingBox);

  Section.Content = _candidate.text();
  Section.HtmlElements = map(_candidate.Elements, [](const LayoutElementPtr_t &e) {
    return e->RawHtml;
  });
  for (const auto &Html : Section.HtmlElements) Section.Html += Html;
  Section.MemberDomOrders = map(
      _candidate.Elements, [](const LayoutElementPtr_t &e) { return e->DomOrder; });

  Section.Metadata.HasImages = _candidate.hasImages();
  Section.Metadata.HasVideos = _candidate.hasVideos();
  Section.Metadata.ElementCount = _candidate.size();
  return Section;
}

SectionVector_t reconstructSections(
    const SectionCandidateVector_t &_candidates,
    const std::vector<enuSectionType> &_types) {
  if (_types.size() != _candidates.size())
    throw exInvalidLayoutData("got " + std::to_string(_types.size()) +
                              " section types for " +
                              std::to_string(_candidates.size()) +
                              " candidates");
  SectionVector_t Result;
  Result.reserve(_candidates.size());
  for (size_t i = 0; i < _candidates.size(); ++i) {
    auto Section = reconstructSection(i + 1, _candidates[i], _types[i]);
    // An overlapping member reaching above the previous section must not move
    // this section's top above it
    if (!Result.empty() &&
        Section.BoundingBox.top() < Result.back().BoundingBox.top()) {
      const auto &Bounds = Section.BoundingBox;
      float Top = Result.back().BoundingBox.top();
      Section.BoundingBox = stuBoundingBox::fromEdges(
          Bounds.left(), Top, Bounds.right(), std::max(Top, Bounds.bottom()));
    }
    Result.push_back(std::move(Section));
  }
  return Result;
}

}  // namespace SectLA
}  // namespace Flint
