#ifndef __FLINT_SECTLA_GROUPER__
#define __FLINT_SECTLA_GROUPER__

#include <optional>
#include <string>

#include "options.h"
#include "wla.h"

namespace Flint {
namespace SectLA {

enum class enuSplitReason { None, Gap, Background, Border };

std::string toString(enuSplitReason _reason);

bool hasBackgroundDiscontinuity(const Flint::WLA::stuLayoutElement &_previous,
                                const Flint::WLA::stuLayoutElement &_next);
bool hasBorderDivider(const Flint::WLA::stuLayoutElement &_previous,
                      const Flint::WLA::stuLayoutElement &_next);

/// Why `_next` must open a new candidate after `_previous`, or None when it
/// continues the current one. Overlapping elements never split.
enuSplitReason splitReason(const Flint::WLA::stuLayoutElement &_previous,
                           const Flint::WLA::stuLayoutElement &_next,
                           const stuDetectionOptions &_options);

struct stuGroupingState {
  std::optional<Flint::WLA::stuSectionCandidate> Current;
  Flint::WLA::SectionCandidateVector_t Closed;
};

stuGroupingState groupingStep(stuGroupingState _state,
                              const Flint::WLA::LayoutElementPtr_t &_element,
                              const stuDetectionOptions &_options);

/// Partitions document-ordered elements into contiguous candidates in a
/// single sweep. Every element lands in exactly one candidate.
Flint::WLA::SectionCandidateVector_t groupElements(
    const Flint::WLA::LayoutElementPtrVector_t &_elements,
    const stuDetectionOptions &_options);

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_GROUPER__
