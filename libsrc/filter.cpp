#include "filter.h"

#include <cctype>
#include <map>

#include "algorithm.hpp"

namespace Flint {
namespace SectLA {

using namespace Flint::WLA;
using namespace Flint::Common;

constexpr size_t NO_INDEX = static_cast<size_t>(-1);

std::string toString(enuFilterVerdict _verdict) {
  switch (_verdict) {
    case enuFilterVerdict::Kept:
      return "Kept";
    case enuFilterVerdict::Invisible:
      return "Invisible";
    case enuFilterVerdict::TooSmall:
      return "TooSmall";
    case enuFilterVerdict::NoContent:
      return "NoContent";
    case enuFilterVerdict::RepresentedByDescendant:
      return "RepresentedByDescendant";
    case enuFilterVerdict::AbsorbedByStyledWrapper:
      return "AbsorbedByStyledWrapper";
  }
  return "Unknown";
}

void validateLayoutElements(const LayoutElementPtrVector_t &_elements) {
  const stuLayoutElement *Previous = nullptr;
  for (size_t i = 0; i < _elements.size(); ++i) {
    const auto &Element = _elements[i];
    if (Element.get() == nullptr)
      throw exInvalidLayoutData("null element at position " +
                                std::to_string(i));
    auto Where = "element #" + std::to_string(Element->DomOrder);
    if (Element->Tag.empty()) throw exInvalidLayoutData(Where + " has no tag");
    if (!Element->BoundingBox.isFinite())
      throw exInvalidLayoutData(Where + " has non-finite box coordinates");
    if (Element->BoundingBox.width() < 0.f ||
        Element->BoundingBox.height() < 0.f)
      throw exInvalidLayoutData(Where + " has a negative box size");
    if (Element->ParentDomOrder != NO_PARENT &&
        (Element->ParentDomOrder < 0 ||
         Element->ParentDomOrder >= Element->DomOrder))
      throw exInvalidLayoutData(Where + " names #" +
                                std::to_string(Element->ParentDomOrder) +
                                " as parent, which does not precede it");
    if (Previous != nullptr && Element->DomOrder <= Previous->DomOrder)
      throw exInvalidLayoutData(Where +
                                " is out of document order (follows #" +
                                std::to_string(Previous->DomOrder) + ")");
    Previous = Element.get();
  }
}

namespace {

std::string stripWhitespace(const std::string &_text) {
  std::string Result;
  Result.reserve(_text.size());
  for (char Char : _text)
    if (!std::isspace(static_cast<unsigned char>(Char))) Result.push_back(Char);
  return Result;
}

class clsElementHierarchy {
 private:
  bool HasParentLinks;
  std::map<int32_t, LayoutElementPtr_t> ByDomOrder;

 public:
  explicit clsElementHierarchy(const LayoutElementPtrVector_t &_elements)
      : HasParentLinks(any(_elements, [](const LayoutElementPtr_t &e) {
          return e->ParentDomOrder != NO_PARENT;
        })) {
    for (const auto &Element : _elements)
      this->ByDomOrder[Element->DomOrder] = Element;
  }

  bool isAncestorOf(const stuLayoutElement &_ancestor,
                    const stuLayoutElement &_element) const {
    if (this->HasParentLinks == false)
      return _ancestor.DomOrder < _element.DomOrder &&
             _ancestor.BoundingBox.contains(_element.BoundingBox) &&
             (_ancestor.RawHtml.empty() || _element.RawHtml.empty() ||
              _ancestor.RawHtml.find(_element.RawHtml) != std::string::npos);

    int32_t Parent = _element.ParentDomOrder;
    while (Parent != NO_PARENT) {
      if (Parent == _ancestor.DomOrder) return true;
      // Parents always precede their children in document order
      if (Parent < _ancestor.DomOrder) return false;
      auto Iterator = this->ByDomOrder.find(Parent);
      if (Iterator == this->ByDomOrder.end()) return false;
      Parent = Iterator->second->ParentDomOrder;
    }
    return false;
  }
};

bool isRepresentedBy(const stuLayoutElement &_wrapper,
                     const LayoutElementPtrVector_t &_descendants) {
  if (_wrapper.HasImage &&
      !any(_descendants,
           [](const LayoutElementPtr_t &e) { return e->HasImage; }))
    return false;
  if (_wrapper.HasVideo &&
      !any(_descendants,
           [](const LayoutElementPtr_t &e) { return e->HasVideo; }))
    return false;
  if (_wrapper.HasText == false) return true;

  auto WrapperText = stripWhitespace(_wrapper.Text);
  if (WrapperText.empty())
    return any(_descendants,
               [](const LayoutElementPtr_t &e) { return e->HasText; });

  size_t Covered = 0;
  size_t SearchFrom = 0;
  for (const auto &Descendant : _descendants) {
    auto Text = stripWhitespace(Descendant->Text);
    if (Text.empty()) continue;
    auto Position = WrapperText.find(Text, SearchFrom);
    if (Position == std::string::npos) return false;
    Covered += Text.size();
    SearchFrom = Position + Text.size();
  }
  return Covered >= WrapperText.size();
}

}  // namespace

stuFilterResult filterElements(const LayoutElementPtrVector_t &_elements,
                               const stuDetectionOptions &_options) {
  validateLayoutElements(_elements);

  stuFilterResult Result;
  Result.Decisions.reserve(_elements.size());

  std::vector<size_t> Qualifying;
  for (const auto &Element : _elements) {
    enuFilterVerdict Verdict = enuFilterVerdict::Kept;
    if (Element->Style.Visible == false)
      Verdict = enuFilterVerdict::Invisible;
    else if (Element->BoundingBox.width() < _options.MinWidthPx ||
             Element->BoundingBox.height() < _options.MinHeightPx)
      Verdict = enuFilterVerdict::TooSmall;
    else if (Element->hasContent() == false)
      Verdict = enuFilterVerdict::NoContent;

    if (Verdict == enuFilterVerdict::Kept)
      Qualifying.push_back(Result.Decisions.size());
    Result.Decisions.push_back(stuFilterDecision{Element, Verdict});
  }

  // Nearest qualifying ancestor of every qualifying element, found with a
  // document-order stack of open ancestors
  clsElementHierarchy Hierarchy(_elements);
  std::map<size_t, size_t> QualifyingParent;
  std::map<size_t, LayoutElementPtrVector_t> QualifyingChildren;
  std::vector<size_t> OpenAncestors;
  for (size_t Index : Qualifying) {
    const auto &Element = *Result.Decisions[Index].Element;
    while (!OpenAncestors.empty() &&
           !Hierarchy.isAncestorOf(
               *Result.Decisions[OpenAncestors.back()].Element, Element))
      OpenAncestors.pop_back();
    size_t Parent = OpenAncestors.empty() ? NO_INDEX : OpenAncestors.back();
    QualifyingParent[Index] = Parent;
    if (Parent != NO_INDEX)
      QualifyingChildren[Parent].push_back(Result.Decisions[Index].Element);
    OpenAncestors.push_back(Index);
  }

  // Ancestors precede descendants, so a parent's verdict is always final
  // before its children are visited
  std::map<size_t, bool> Absorbs;
  for (size_t Index : Qualifying) {
    auto &Decision = Result.Decisions[Index];
    size_t Parent = QualifyingParent[Index];
    if (Parent != NO_INDEX &&
        (Absorbs[Parent] || Result.Decisions[Parent].Verdict ==
                                enuFilterVerdict::AbsorbedByStyledWrapper)) {
      Decision.Verdict = enuFilterVerdict::AbsorbedByStyledWrapper;
      continue;
    }

    auto ChildrenIterator = QualifyingChildren.find(Index);
    if (ChildrenIterator == QualifyingChildren.end()) continue;

    if (Decision.Element->Style.isDistinguishing() ||
        !isRepresentedBy(*Decision.Element, ChildrenIterator->second))
      Absorbs[Index] = true;
    else
      Decision.Verdict = enuFilterVerdict::RepresentedByDescendant;
  }

  for (const auto &Decision : Result.Decisions)
    if (Decision.Verdict == enuFilterVerdict::Kept)
      Result.Kept.push_back(Decision.Element);

  return Result;
}

}  // namespace SectLA
}  // namespace Flint
