#include "classifier.h"

#include "algorithm.hpp"

namespace Flint {
namespace SectLA {

using namespace Flint::WLA;
using namespace Flint::Common;

bool looksLikeHeader(const stuCandidateView &_view) {
  const auto &Bounds = _view.Candidate.BoundingBox;
  return _view.isFirst() && Bounds.top() < _view.Options.HeaderMaxTopPx &&
         Bounds.height() < _view.Options.HeaderMaxHeightPx;
}

bool looksLikeHero(const stuCandidateView &_view) {
  return _view.Index <= _view.Options.HeroMaxIndex && _view.hasMedia() &&
         _view.Candidate.BoundingBox.height() > _view.Options.HeroMinHeightPx;
}

bool looksLikeFooter(const stuCandidateView &_view) {
  if (_view.isLast() == false || _view.Page.CandidateCount < 2) return false;
  const auto &Elements = _view.Candidate.Elements;
  auto SmallTextOnly = count(Elements, [&](const LayoutElementPtr_t &e) {
    return !e->HasImage && !e->HasVideo &&
           e->BoundingBox.height() <=
               _view.Options.FooterSmallElementMaxHeightPx;
  });
  return static_cast<float>(SmallTextOnly) >=
         _view.Options.FooterMinSmallElementRatio *
             static_cast<float>(Elements.size());
}

bool looksLikeSidebar(const stuCandidateView &_view) {
  return _view.Candidate.BoundingBox.width() <
         _view.Options.SidebarMaxWidthRatio * _view.Page.PageSize.Width;
}

bool looksLikeContent(const stuCandidateView &_view) {
  return _view.Candidate.size() > 1 ||
         utf8Length(_view.Candidate.text()) >
             _view.Options.SubstantialTextLength;
}

const ClassificationRuleVector_t &defaultClassificationRules() {
  static const ClassificationRuleVector_t Rules{
      {"header", enuSectionType::Header, looksLikeHeader},
      {"hero", enuSectionType::Hero, looksLikeHero},
      {"footer", enuSectionType::Footer, looksLikeFooter},
      {"sidebar", enuSectionType::Sidebar, looksLikeSidebar},
      {"content", enuSectionType::Content, looksLikeContent},
      {"section", enuSectionType::Section,
       [](const stuCandidateView &) { return true; }},
  };
  return Rules;
}

enuSectionType classifyCandidate(const stuCandidateView &_view,
                                 const ClassificationRuleVector_t &_rules) {
  for (const auto &Rule : _rules)
    if (Rule.Predicate && Rule.Predicate(_view)) return Rule.Type;
  return enuSectionType::Section;
}

std::vector<enuSectionType> classifyCandidates(
    const SectionCandidateVector_t &_candidates, const stuSize &_pageSize,
    const stuDetectionOptions &_options,
    const ClassificationRuleVector_t &_rules) {
  stuPageContext Page{_pageSize, _candidates.size()};
  std::vector<enuSectionType> Result;
  Result.reserve(_candidates.size());
  for (size_t Index = 0; Index < _candidates.size(); ++Index)
    Result.push_back(classifyCandidate(
        stuCandidateView{Index, _candidates[Index], Page, _options}, _rules));
  return Result;
}

}  // namespace SectLA
}  // namespace Flint
