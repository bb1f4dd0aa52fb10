#ifndef __FLINT_SECTLA_LAYOUT_PROVIDER__
#define __FLINT_SECTLA_LAYOUT_PROVIDER__

#include <stdint.h>

#include <string>

#include "wla.h"

namespace Flint {
namespace SectLA {

enum class enuWaitStrategy { Load, DomContentLoaded, NetworkIdle };

struct stuRenderConfig {
  uint32_t ViewportWidth = 1280;
  uint32_t ViewportHeight = 800;
  enuWaitStrategy WaitStrategy = enuWaitStrategy::NetworkIdle;
  uint32_t TimeoutMs = 30000;
};

enum class enuRenderSource { Url, Html, SnapshotFile };

struct stuRenderRequest {
  enuRenderSource Kind;
  std::string Source;
  stuRenderConfig Config;
};

/// Produces the layout snapshot of a rendered page. Implementations raise
/// exRenderFailure when the page cannot be rendered; the detector propagates
/// it unchanged.
class intfLayoutProvider {
 public:
  virtual ~intfLayoutProvider() {}
  virtual Flint::WLA::stuLayoutSnapshot render(
      const stuRenderRequest &_request) = 0;
};

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_LAYOUT_PROVIDER__
