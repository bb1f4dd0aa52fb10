#include <emscripten.h>
#include <emscripten/bind.h>
#include <sectla/sectla.h>
#include <sectla/serialization.h>

using namespace emscripten;
using namespace Flint::SectLA;

std::string detectSectionsJson(const std::string &_snapshotJson,
                               const std::string &_optionsJson) {
  auto Options =
      _optionsJson.empty()
          ? stuDetectionOptions()
          : parseDetectionOptions(parseJsonText(_optionsJson, "options"));
  auto Snapshot = parseLayoutSnapshot(_snapshotJson);
  auto Sections = detectSections(Snapshot, Options);
  return jsonToText(sectionsToJson(Sections, Snapshot.Url));
}

EMSCRIPTEN_BINDINGS(SECTLAJS) {
  function("detectSections", &detectSectionsJson);
}
