#ifndef __FLINT_SECTLA__
#define __FLINT_SECTLA__

#include <memory>
#include <string>

#include "layoutProvider.h"
#include "options.h"
#include "wla.h"

namespace Flint {
namespace SectLA {

void setDebugOutputPath(const std::string& _path);

/// Snapshot → filter → group → classify → reconstruct. Pure: identical
/// inputs always yield identical sections.
Flint::WLA::SectionVector_t detectSections(
    const Flint::WLA::stuLayoutSnapshot& _snapshot,
    const stuDetectionOptions& _options = stuDetectionOptions());

class clsSectLaInternals;
class clsSectLa {
 private:
  std::unique_ptr<clsSectLaInternals> Internals;

 public:
  explicit clsSectLa(
      const stuDetectionOptions& _options = stuDetectionOptions());
  ~clsSectLa();

  const stuDetectionOptions& options() const;

 public:
  Flint::WLA::SectionVector_t detectSections(
      const Flint::WLA::stuLayoutSnapshot& _snapshot);
  /// Render failures of the provider propagate unchanged.
  Flint::WLA::SectionVector_t detectSections(intfLayoutProvider& _provider,
                                             const stuRenderRequest& _request);

 public:
  void enableDebugging(const std::string& _basename);
};

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA__
