#ifndef __FLINT_SECTLA_RECONSTRUCTOR__
#define __FLINT_SECTLA_RECONSTRUCTOR__

#include <vector>

#include "wla.h"

namespace Flint {
namespace SectLA {

Flint::WLA::stuSection reconstructSection(
    size_t _id, const Flint::WLA::stuSectionCandidate &_candidate,
    Flint::WLA::enuSectionType _type);

/// `_types` holds one entry per candidate. Section ids are assigned 1..N in
/// candidate order. Section tops never decrease with id: a section whose
/// members reach above the previous section's top is cut at that top.
Flint::WLA::SectionVector_t reconstructSections(
    const Flint::WLA::SectionCandidateVector_t &_candidates,
    const std::vector<Flint::WLA::enuSectionType> &_types);

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_RECONSTRUCTOR__
