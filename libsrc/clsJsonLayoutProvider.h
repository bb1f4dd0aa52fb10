#ifndef __FLINT_SECTLA_CLSJSONLAYOUTPROVIDER__
#define __FLINT_SECTLA_CLSJSONLAYOUTPROVIDER__

#include <string>

#include "layoutProvider.h"

namespace Flint {
namespace SectLA {

/// Serves snapshots captured ahead of time by a browser and stored as JSON
/// files. Only `SnapshotFile` requests are supported: rendering URLs or HTML
/// strings needs a live browser.
class clsJsonLayoutProvider : public intfLayoutProvider {
 private:
  std::string BasePath;

 public:
  explicit clsJsonLayoutProvider(const std::string &_basePath = std::string());

  Flint::WLA::stuLayoutSnapshot render(
      const stuRenderRequest &_request) override;
};

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_CLSJSONLAYOUTPROVIDER__
