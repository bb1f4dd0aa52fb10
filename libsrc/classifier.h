#ifndef __FLINT_SECTLA_CLASSIFIER__
#define __FLINT_SECTLA_CLASSIFIER__

#include <functional>
#include <string>
#include <vector>

#include "options.h"
#include "wla.h"

namespace Flint {
namespace SectLA {

struct stuPageContext {
  Flint::WLA::stuSize PageSize;
  size_t CandidateCount;
};

/// Everything a classification rule may look at for a single candidate.
struct stuCandidateView {
  size_t Index;
  const Flint::WLA::stuSectionCandidate &Candidate;
  const stuPageContext &Page;
  const stuDetectionOptions &Options;

  bool isFirst() const { return this->Index == 0; }
  bool isLast() const { return this->Index + 1 == this->Page.CandidateCount; }
  bool hasMedia() const {
    return this->Candidate.hasImages() || this->Candidate.hasVideos();
  }
};

typedef std::function<bool(const stuCandidateView &)>
    ClassificationPredicate_t;

struct stuClassificationRule {
  std::string Name;
  Flint::WLA::enuSectionType Type;
  ClassificationPredicate_t Predicate;
};
typedef std::vector<stuClassificationRule> ClassificationRuleVector_t;

bool looksLikeHeader(const stuCandidateView &_view);
bool looksLikeHero(const stuCandidateView &_view);
bool looksLikeFooter(const stuCandidateView &_view);
bool looksLikeSidebar(const stuCandidateView &_view);
bool looksLikeContent(const stuCandidateView &_view);

/// header, hero, footer, sidebar, content, then the catch-all `section`.
const ClassificationRuleVector_t &defaultClassificationRules();

/// First matching rule wins. Falls back to `section` when no rule matches.
Flint::WLA::enuSectionType classifyCandidate(
    const stuCandidateView &_view,
    const ClassificationRuleVector_t &_rules = defaultClassificationRules());

std::vector<Flint::WLA::enuSectionType> classifyCandidates(
    const Flint::WLA::SectionCandidateVector_t &_candidates,
    const Flint::WLA::stuSize &_pageSize, const stuDetectionOptions &_options,
    const ClassificationRuleVector_t &_rules = defaultClassificationRules());

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_CLASSIFIER__
