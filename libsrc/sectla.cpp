#include "sectla.h"

#include <sstream>

#include "algorithm.hpp"
#include "classifier.h"
#include "debug.h"
#include "filter.h"
#include "grouper.h"
#include "reconstructor.h"

namespace Flint {
namespace SectLA {
using namespace Flint::WLA;
using namespace Flint::Common;

class clsSectLaInternals {
 private:
  stuDetectionOptions Options;

 private:
  void traceFilterDecisions(const stuFilterResult& _filterResult);
  void traceCandidates(const SectionCandidateVector_t& _candidates);

 public:
  explicit clsSectLaInternals(const stuDetectionOptions& _options)
      : Options(_options) {}

  const stuDetectionOptions& options() const { return this->Options; }

 public:
  SectionVector_t detectSections(const stuLayoutSnapshot& _snapshot);
};

clsSectLa::clsSectLa(const stuDetectionOptions& _options)
    : Internals(new clsSectLaInternals(_options)) {}

clsSectLa::~clsSectLa() {
  clsSectLaDebug::instance().unregisterObject(this->Internals.get());
}

const stuDetectionOptions& clsSectLa::options() const {
  return this->Internals->options();
}

SectionVector_t clsSectLa::detectSections(const stuLayoutSnapshot& _snapshot) {
  return this->Internals->detectSections(_snapshot);
}

SectionVector_t clsSectLa::detectSections(intfLayoutProvider& _provider,
                                          const stuRenderRequest& _request) {
  return this->Internals->detectSections(_provider.render(_request));
}

void clsSectLa::enableDebugging(const std::string& _basename) {
  if (!_basename.empty())
    clsSectLaDebug::instance().registerObject(this->Internals.get(), _basename);
}

void clsSectLaInternals::traceFilterDecisions(
    const stuFilterResult& _filterResult) {
  auto& Debug = clsSectLaDebug::instance();
  for (const auto& Decision : _filterResult.Decisions)
    Debug.trace(this, [&]() {
      std::ostringstream ss;
      ss << "filter: <" << Decision.Element->Tag << "> #"
         << Decision.Element->DomOrder << " "
         << toString(Decision.Verdict);
      return ss.str();
    });
}

void clsSectLaInternals::traceCandidates(
    const SectionCandidateVector_t& _candidates) {
  auto& Debug = clsSectLaDebug::instance();
  for (size_t i = 0; i < _candidates.size(); ++i)
    Debug.trace(this, [&]() {
      const auto& Candidate = _candidates[i];
      std::ostringstream ss;
      ss << "group: candidate " << i << " has " << Candidate.size()
         << " element(s) from #" << Candidate.Elements.front()->DomOrder
         << " to #" << Candidate.last()->DomOrder;
      if (i > 0)
        ss << ", split by "
           << toString(splitReason(*_candidates[i - 1].last(),
                                   *Candidate.Elements.front(), this->Options));
      return ss.str();
    });
}

SectionVector_t clsSectLaInternals::detectSections(
    const stuLayoutSnapshot& _snapshot) {
  auto& Debug = clsSectLaDebug::instance();
  bool Debugging = Debug.isObjectRegistered(this);

  auto FilterResult = filterElements(_snapshot.Elements, this->Options);
  auto PageSize = _snapshot.effectivePageSize();
  auto Candidates = groupElements(FilterResult.Kept, this->Options);
  auto Types = classifyCandidates(Candidates, PageSize, this->Options);
  auto Sections = reconstructSections(Candidates, Types);

  if (Debugging) {
    Debug.setPageSize(this, PageSize);
    this->traceFilterDecisions(FilterResult);
    this->traceCandidates(Candidates);
    for (const auto& Section : Sections)
      Debug.trace(this, [&]() {
        return "classify: section " + std::to_string(Section.ID) + " is " +
               toString(Section.Type);
      });

    Debug.createImage(this).add(FilterResult.Kept).save("elements");
    Debug.createImage(this).add(Candidates).save("candidates");
    Debug.createImage(this).add(Sections).save("sections");
  }

  return Sections;
}

SectionVector_t detectSections(const stuLayoutSnapshot& _snapshot,
                               const stuDetectionOptions& _options) {
  return clsSectLaInternals(_options).detectSections(_snapshot);
}

void setDebugOutputPath(const std::string& _path) {
  clsSectLaDebug::instance().setDebugOutputPath(_path);
}

}  // namespace SectLA
}  // namespace Flint
