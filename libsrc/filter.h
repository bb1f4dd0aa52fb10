#ifndef __FLINT_SECTLA_FILTER__
#define __FLINT_SECTLA_FILTER__

#include <string>
#include <vector>

#include "options.h"
#include "wla.h"

namespace Flint {
namespace SectLA {

enum class enuFilterVerdict {
  Kept,
  Invisible,
  TooSmall,
  NoContent,
  RepresentedByDescendant,
  AbsorbedByStyledWrapper
};

std::string toString(enuFilterVerdict _verdict);

struct stuFilterDecision {
  Flint::WLA::LayoutElementPtr_t Element;
  enuFilterVerdict Verdict;
};

struct stuFilterResult {
  Flint::WLA::LayoutElementPtrVector_t Kept;
  // One decision per input element, in input order
  std::vector<stuFilterDecision> Decisions;
};

/// Throws exInvalidLayoutData on the first malformed element.
void validateLayoutElements(
    const Flint::WLA::LayoutElementPtrVector_t &_elements);

/// Keeps the elements that carry meaningful content. A wrapper and its
/// qualifying descendants are never both kept: the innermost elements win
/// unless the wrapper has its own background/border or content that its
/// descendants do not represent.
stuFilterResult filterElements(
    const Flint::WLA::LayoutElementPtrVector_t &_elements,
    const stuDetectionOptions &_options);

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_FILTER__
