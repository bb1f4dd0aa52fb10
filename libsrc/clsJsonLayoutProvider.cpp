#include "clsJsonLayoutProvider.h"

#include <fstream>
#include <sstream>

#include "serialization.h"

namespace Flint {
namespace SectLA {

using namespace Flint::WLA;

clsJsonLayoutProvider::clsJsonLayoutProvider(const std::string &_basePath)
    : BasePath(_basePath) {}

stuLayoutSnapshot clsJsonLayoutProvider::render(
    const stuRenderRequest &_request) {
  if (_request.Kind != enuRenderSource::SnapshotFile)
    throw exRenderFailure(
        "a live browser is required to render URLs or HTML strings");

  std::string Path = _request.Source;
  if (!this->BasePath.empty() && !Path.empty() && Path.front() != '/')
    Path = this->BasePath + "/" + Path;

  std::ifstream File(Path);
  if (File.is_open() == false)
    throw exRenderFailure("unable to open snapshot `" + Path + "`");

  std::ostringstream Contents;
  Contents << File.rdbuf();
  if (File.bad()) throw exRenderFailure("unable to read snapshot `" + Path + "`");

  return parseLayoutSnapshot(Contents.str());
}

}  // namespace SectLA
}  // namespace Flint
