#include "serialization.h"

#include <cstdlib>
#include <map>
#include <memory>
#include <sstream>

namespace Flint {
namespace SectLA {

using namespace Flint::WLA;

namespace {

const Json::Value &requireMember(const Json::Value &_object, const char *_key,
                                 const std::string &_where) {
  if (_object.isMember(_key) == false || _object[_key].isNull())
    throw exInvalidLayoutData(_where + " is missing `" + _key + "`");
  return _object[_key];
}

/// Accepts plain numbers as well as CSS lengths such as "12px" or the
/// leading width of a border shorthand like "1px solid rgb(0, 0, 0)".
float parseLength(const Json::Value &_value, const std::string &_where) {
  if (_value.isNumeric()) return _value.asFloat();
  if (_value.isString()) {
    auto Text = _value.asString();
    char *End = nullptr;
    float Value = std::strtof(Text.c_str(), &End);
    if (End != Text.c_str()) return Value;
  }
  throw exInvalidLayoutData(_where + " is not a length: " +
                            jsonToText(_value));
}

float requireNumber(const Json::Value &_object, const char *_key,
                    const std::string &_where) {
  const auto &Value = requireMember(_object, _key, _where);
  if (Value.isNumeric() == false)
    throw exInvalidLayoutData(_where + "." + _key + " is not a number");
  return Value.asFloat();
}

bool optionalBool(const Json::Value &_object, const char *_key, bool _default,
                  const std::string &_where) {
  const auto &Value = _object[_key];
  if (Value.isNull()) return _default;
  if (Value.isBool() == false)
    throw exInvalidLayoutData(_where + "." + _key + " is not a boolean");
  return Value.asBool();
}

std::string optionalString(const Json::Value &_object, const char *_key,
                           const std::string &_where) {
  const auto &Value = _object[_key];
  if (Value.isNull()) return std::string();
  if (Value.isString() == false)
    throw exInvalidLayoutData(_where + "." + _key + " is not a string");
  return Value.asString();
}

stuEdges parseEdges(const Json::Value &_object, const char *_key,
                    const std::string &_where) {
  const auto &Value = _object[_key];
  if (Value.isNull()) return stuEdges();
  auto Where = _where + "." + _key;
  if (Value.isObject() == false) return stuEdges(parseLength(Value, Where));

  auto edge = [&](const char *_edge) {
    const auto &Edge = Value[_edge];
    if (Edge.isNull()) return 0.f;
    return parseLength(Edge, Where + "." + _edge);
  };
  return stuEdges(edge("top"), edge("right"), edge("bottom"), edge("left"));
}

}  // namespace

Json::Value parseJsonText(const std::string &_text, const std::string &_what) {
  Json::CharReaderBuilder Builder;
  Json::Value Root;
  std::string Errors;
  std::istringstream Stream(_text);
  if (Json::parseFromStream(Builder, Stream, &Root, &Errors) == false)
    throw exInvalidLayoutData(_what + " is not valid JSON: " + Errors);
  return Root;
}

std::string jsonToText(const Json::Value &_json, bool _indented) {
  Json::StreamWriterBuilder Builder;
  Builder["indentation"] = _indented ? "  " : "";
  return Json::writeString(Builder, _json);
}

stuLayoutElement parseLayoutElement(const Json::Value &_json) {
  if (_json.isObject() == false)
    throw exInvalidLayoutData("element is not an object: " +
                              jsonToText(_json));

  stuLayoutElement Element;
  const auto &DomOrder = requireMember(_json, "domOrder", "element");
  if (DomOrder.isInt() == false)
    throw exInvalidLayoutData("element.domOrder is not an integer");
  Element.DomOrder = DomOrder.asInt();
  auto Where = "element #" + std::to_string(Element.DomOrder);

  const auto &Tag = requireMember(_json, "tag", Where);
  if (Tag.isString() == false)
    throw exInvalidLayoutData(Where + ".tag is not a string");
  Element.Tag = Tag.asString();

  const auto &Parent = _json["parentDomOrder"];
  if (Parent.isNull() == false) {
    if (Parent.isInt() == false)
      throw exInvalidLayoutData(Where + ".parentDomOrder is not an integer");
    Element.ParentDomOrder = Parent.asInt();
  }

  const auto &Box = requireMember(_json, "box", Where);
  if (Box.isObject() == false)
    throw exInvalidLayoutData(Where + ".box is not an object");
  auto BoxWhere = Where + ".box";
  Element.BoundingBox = stuBoundingBox(requireNumber(Box, "top", BoxWhere),
                                       requireNumber(Box, "left", BoxWhere),
                                       requireNumber(Box, "width", BoxWhere),
                                       requireNumber(Box, "height", BoxWhere));

  const auto &Style = requireMember(_json, "style", Where);
  if (Style.isObject() == false)
    throw exInvalidLayoutData(Where + ".style is not an object");
  auto StyleWhere = Where + ".style";
  Element.Style.BackgroundColor =
      optionalString(Style, "backgroundColor", StyleWhere);
  Element.Style.BorderWidth = parseEdges(Style, "borderWidth", StyleWhere);
  Element.Style.Margin = parseEdges(Style, "margin", StyleWhere);
  Element.Style.Padding = parseEdges(Style, "padding", StyleWhere);
  Element.Style.Visible = optionalBool(Style, "visible", true, StyleWhere);

  Element.Text = optionalString(_json, "text", Where);
  Element.HasText =
      optionalBool(_json, "hasText", !normalizeWhitespace(Element.Text).empty(),
                   Where);
  Element.HasImage = optionalBool(_json, "hasImage", false, Where);
  Element.HasVideo = optionalBool(_json, "hasVideo", false, Where);
  Element.RawHtml = optionalString(_json, "rawHtml", Where);
  return Element;
}

stuLayoutSnapshot parseLayoutSnapshot(const Json::Value &_json) {
  if (_json.isObject() == false)
    throw exInvalidLayoutData("snapshot is not an object");

  stuLayoutSnapshot Snapshot;
  Snapshot.Url = optionalString(_json, "url", "snapshot");

  const auto &Page = _json["page"];
  if (Page.isNull() == false) {
    if (Page.isObject() == false)
      throw exInvalidLayoutData("snapshot.page is not an object");
    Snapshot.PageSize = stuSize(requireNumber(Page, "width", "snapshot.page"),
                                requireNumber(Page, "height", "snapshot.page"));
  }

  const auto &Elements = requireMember(_json, "elements", "snapshot");
  if (Elements.isArray() == false)
    throw exInvalidLayoutData("snapshot.elements is not an array");
  Snapshot.Elements.reserve(Elements.size());
  for (const auto &Item : Elements)
    Snapshot.Elements.push_back(
        std::make_shared<const stuLayoutElement>(parseLayoutElement(Item)));
  return Snapshot;
}

stuLayoutSnapshot parseLayoutSnapshot(const std::string &_text) {
  return parseLayoutSnapshot(parseJsonText(_text, "snapshot"));
}

stuDetectionOptions parseDetectionOptions(const Json::Value &_json,
                                          const stuDetectionOptions &_base) {
  static const std::map<std::string, float stuDetectionOptions::*>
      FloatFields{
          {"gapThresholdPx", &stuDetectionOptions::GapThresholdPx},
          {"minHeightPx", &stuDetectionOptions::MinHeightPx},
          {"minWidthPx", &stuDetectionOptions::MinWidthPx},
          {"headerMaxTopPx", &stuDetectionOptions::HeaderMaxTopPx},
          {"headerMaxHeightPx", &stuDetectionOptions::HeaderMaxHeightPx},
          {"heroMinHeightPx", &stuDetectionOptions::HeroMinHeightPx},
          {"footerSmallElementMaxHeightPx",
           &stuDetectionOptions::FooterSmallElementMaxHeightPx},
          {"footerMinSmallElementRatio",
           &stuDetectionOptions::FooterMinSmallElementRatio},
          {"sidebarMaxWidthRatio", &stuDetectionOptions::SidebarMaxWidthRatio},
      };
  static const std::map<std::string, size_t stuDetectionOptions::*>
      CountFields{
          {"heroMaxIndex", &stuDetectionOptions::HeroMaxIndex},
          {"substantialTextLength",
           &stuDetectionOptions::SubstantialTextLength},
      };

  if (_json.isObject() == false)
    throw exInvalidLayoutData("options is not an object");

  stuDetectionOptions Options = _base;
  for (const auto &Key : _json.getMemberNames()) {
    const auto &Value = _json[Key];
    auto FloatField = FloatFields.find(Key);
    if (FloatField != FloatFields.end()) {
      if (Value.isNumeric() == false || Value.asDouble() < 0.)
        throw exInvalidLayoutData("options." + Key +
                                  " must be a non-negative number");
      Options.*(FloatField->second) = Value.asFloat();
      continue;
    }
    auto CountField = CountFields.find(Key);
    if (CountField != CountFields.end()) {
      if (Value.isUInt64() == false)
        throw exInvalidLayoutData("options." + Key +
                                  " must be a non-negative integer");
      Options.*(CountField->second) = static_cast<size_t>(Value.asUInt64());
      continue;
    }
    throw exInvalidLayoutData("unknown option `" + Key + "`");
  }
  return Options;
}

Json::Value toJson(const stuBoundingBox &_bounds) {
  Json::Value Result(Json::objectValue);
  Result["top"] = _bounds.top();
  Result["left"] = _bounds.left();
  Result["width"] = _bounds.width();
  Result["height"] = _bounds.height();
  return Result;
}

Json::Value toJson(const stuSection &_section) {
  Json::Value Metadata(Json::objectValue);
  Metadata["hasImages"] = _section.Metadata.HasImages;
  Metadata["hasVideos"] = _section.Metadata.HasVideos;
  Metadata["elementCount"] =
      static_cast<Json::UInt64>(_section.Metadata.ElementCount);

  Json::Value Result(Json::objectValue);
  Result["id"] = static_cast<Json::UInt64>(_section.ID);
  Result["type"] = toString(_section.Type);
  Result["content"] = _section.Content;
  Result["bounds"] = toJson(_section.BoundingBox);
  Result["metadata"] = Metadata;
  Result["html"] = _section.Html;
  return Result;
}

Json::Value sectionsToJson(const SectionVector_t &_sections,
                           const std::string &_url) {
  Json::Value Sections(Json::arrayValue);
  for (const auto &Section : _sections) Sections.append(toJson(Section));

  Json::Value Result(Json::objectValue);
  if (!_url.empty()) Result["url"] = _url;
  Result["sections"] = Sections;
  Result["total_sections"] = static_cast<Json::UInt64>(_sections.size());
  return Result;
}

}  // namespace SectLA
}  // namespace Flint
