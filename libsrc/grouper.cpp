#include "grouper.h"

#include "algorithm.hpp"

namespace Flint {
namespace SectLA {

using namespace Flint::WLA;
using namespace Flint::Common;

std::string toString(enuSplitReason _reason) {
  switch (_reason) {
    case enuSplitReason::None:
      return "None";
    case enuSplitReason::Gap:
      return "Gap";
    case enuSplitReason::Background:
      return "Background";
    case enuSplitReason::Border:
      return "Border";
  }
  return "Unknown";
}

bool hasBackgroundDiscontinuity(const stuLayoutElement &_previous,
                                const stuLayoutElement &_next) {
  // An undefined or inherited background is never a discontinuity
  if (!_previous.Style.hasOpaqueBackground() ||
      !_next.Style.hasOpaqueBackground())
    return false;
  return normalizeColor(_previous.Style.BackgroundColor) !=
         normalizeColor(_next.Style.BackgroundColor);
}

bool hasBorderDivider(const stuLayoutElement &_previous,
                      const stuLayoutElement &_next) {
  return _next.Style.BorderWidth.Top > 0.f ||
         _previous.Style.BorderWidth.Bottom > 0.f;
}

enuSplitReason splitReason(const stuLayoutElement &_previous,
                           const stuLayoutElement &_next,
                           const stuDetectionOptions &_options) {
  float Gap = _previous.BoundingBox.verticalGapTo(_next.BoundingBox);
  if (Gap < 0.f) return enuSplitReason::None;
  if (Gap > _options.GapThresholdPx) return enuSplitReason::Gap;
  if (hasBackgroundDiscontinuity(_previous, _next))
    return enuSplitReason::Background;
  if (hasBorderDivider(_previous, _next)) return enuSplitReason::Border;
  return enuSplitReason::None;
}

stuGroupingState groupingStep(stuGroupingState _state,
                              const LayoutElementPtr_t &_element,
                              const stuDetectionOptions &_options) {
  if (_state.Current.has_value() == false) {
    _state.Current.emplace(_element);
    return _state;
  }

  if (splitReason(*_state.Current->last(), *_element, _options) ==
      enuSplitReason::None) {
    _state.Current->append_(_element);
    return _state;
  }

  _state.Closed.push_back(std::move(*_state.Current));
  _state.Current.emplace(_element);
  return _state;
}

SectionCandidateVector_t groupElements(const LayoutElementPtrVector_t &_elements,
                                       const stuDetectionOptions &_options) {
  auto Final = foldLeft(
      _elements, stuGroupingState(),
      [&_options](stuGroupingState _state, const LayoutElementPtr_t &_element) {
        return groupingStep(std::move(_state), _element, _options);
      });
  if (Final.Current.has_value())
    Final.Closed.push_back(std::move(*Final.Current));
  return std::move(Final.Closed);
}

}  // namespace SectLA
}  // namespace Flint
