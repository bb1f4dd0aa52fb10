#ifndef __FLINT_SECTLA_SERIALIZATION__
#define __FLINT_SECTLA_SERIALIZATION__

#include <json/json.h>

#include <string>

#include "options.h"
#include "wla.h"

namespace Flint {
namespace SectLA {

/// Throws exInvalidLayoutData naming `_what` when `_text` is not valid JSON.
Json::Value parseJsonText(const std::string &_text, const std::string &_what);
std::string jsonToText(const Json::Value &_json, bool _indented = false);

Flint::WLA::stuLayoutElement parseLayoutElement(const Json::Value &_json);

/// Builds a snapshot from the JSON exported by the browser side. Any missing
/// `box`/`style` block or malformed value raises exInvalidLayoutData.
Flint::WLA::stuLayoutSnapshot parseLayoutSnapshot(const Json::Value &_json);
Flint::WLA::stuLayoutSnapshot parseLayoutSnapshot(const std::string &_text);

/// Overrides the fields of `_base` present in `_json` (camelCase keys).
stuDetectionOptions parseDetectionOptions(
    const Json::Value &_json,
    const stuDetectionOptions &_base = stuDetectionOptions());

Json::Value toJson(const Flint::WLA::stuBoundingBox &_bounds);
Json::Value toJson(const Flint::WLA::stuSection &_section);
Json::Value sectionsToJson(const Flint::WLA::SectionVector_t &_sections,
                           const std::string &_url = std::string());

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_SERIALIZATION__
