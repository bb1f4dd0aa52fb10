#include "wla.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "algorithm.hpp"

namespace Flint {
namespace WLA {

using namespace Flint::Common;

void stuBoundingBox::unionWith_(const stuBoundingBox &_other) {
  float X0 = std::min(this->left(), _other.left());
  float Y0 = std::min(this->top(), _other.top());
  float X1 = std::max(this->right(), _other.right());
  float Y1 = std::max(this->bottom(), _other.bottom());
  *this = stuBoundingBox::fromEdges(X0, Y0, X1, Y1);
}

stuBoundingBox stuBoundingBox::unionWith(const stuBoundingBox &_other) const {
  stuBoundingBox Union = *this;
  Union.unionWith_(_other);
  return Union;
}

void stuBoundingBox::intersectWith_(const stuBoundingBox &_other) {
  float X0 = std::max(this->left(), _other.left());
  float Y0 = std::max(this->top(), _other.top());
  float X1 = std::min(this->right(), _other.right());
  float Y1 = std::min(this->bottom(), _other.bottom());
  *this = stuBoundingBox::fromEdges(X0, Y0, std::max(X0, X1), std::max(Y0, Y1));
}

stuBoundingBox stuBoundingBox::intersectWith(
    const stuBoundingBox &_other) const {
  stuBoundingBox Intersection = *this;
  Intersection.intersectWith_(_other);
  return Intersection;
}

float stuBoundingBox::horizontalOverlap(const stuBoundingBox &_other) const {
  float X0 = std::max(this->left(), _other.left());
  float X1 = std::min(this->right(), _other.right());
  return X1 - X0;
}

float stuBoundingBox::verticalOverlap(const stuBoundingBox &_other) const {
  float Y0 = std::max(this->top(), _other.top());
  float Y1 = std::min(this->bottom(), _other.bottom());
  return Y1 - Y0;
}

bool stuBoundingBox::contains(const stuBoundingBox &_other) const {
  return _other.left() >= this->left() && _other.right() <= this->right() &&
         _other.top() >= this->top() && _other.bottom() <= this->bottom();
}

std::string normalizeColor(const std::string &_color) {
  std::string Result;
  Result.reserve(_color.size());
  for (char Char : _color)
    if (!std::isspace(static_cast<unsigned char>(Char)))
      Result.push_back(
          static_cast<char>(std::tolower(static_cast<unsigned char>(Char))));
  return Result;
}

bool isTransparentColor(const std::string &_color) {
  auto Color = normalizeColor(_color);
  if (Color.empty() || Color == "transparent" || Color == "inherit" ||
      Color == "initial" || Color == "unset")
    return true;

  // rgba(r,g,b,a) / hsla(h,s,l,a) with a zero alpha component
  if ((Color.rfind("rgba(", 0) == 0 || Color.rfind("hsla(", 0) == 0) &&
      Color.back() == ')') {
    auto AlphaStart = Color.rfind(',');
    if (AlphaStart == std::string::npos) return false;
    auto Alpha = Color.substr(AlphaStart + 1, Color.size() - AlphaStart - 2);
    bool IsPercent = !Alpha.empty() && Alpha.back() == '%';
    if (IsPercent) Alpha.pop_back();
    char *End = nullptr;
    double Value = std::strtod(Alpha.c_str(), &End);
    if (End == Alpha.c_str()) return false;
    return Value <= 0.0;
  }
  return false;
}

static bool isUtf8Continuation(char _byte) {
  return (static_cast<unsigned char>(_byte) & 0xC0) == 0x80;
}

size_t utf8Length(const std::string &_text) {
  size_t Length = 0;
  for (char Byte : _text)
    if (!isUtf8Continuation(Byte)) ++Length;
  return Length;
}

std::string utf8Prefix(const std::string &_text, size_t _length) {
  size_t Characters = 0;
  for (size_t i = 0; i < _text.size(); ++i) {
    if (isUtf8Continuation(_text[i])) continue;
    if (Characters++ == _length) return _text.substr(0, i);
  }
  return _text;
}

std::string normalizeWhitespace(const std::string &_text) {
  std::string Result;
  Result.reserve(_text.size());
  bool PendingSpace = false;
  for (char Char : _text) {
    if (std::isspace(static_cast<unsigned char>(Char))) {
      PendingSpace = !Result.empty();
      continue;
    }
    if (PendingSpace) Result.push_back(' ');
    PendingSpace = false;
    Result.push_back(Char);
  }
  return Result;
}

stuSize stuLayoutSnapshot::effectivePageSize() const {
  stuSize Result = this->PageSize;
  if (Result.Width < MIN_ITEM_SIZE)
    Result.Width = max(this->Elements, [](const LayoutElementPtr_t &e) {
      return e->BoundingBox.right();
    });
  if (Result.Height < MIN_ITEM_SIZE)
    Result.Height = max(this->Elements, [](const LayoutElementPtr_t &e) {
      return e->BoundingBox.bottom();
    });
  return Result;
}

void stuSectionCandidate::append_(const LayoutElementPtr_t &_element) {
  this->BoundingBox.unionWith_(_element->BoundingBox);
  this->Elements.push_back(_element);
}

bool stuSectionCandidate::hasImages() const {
  return any(this->Elements,
             [](const LayoutElementPtr_t &e) { return e->HasImage; });
}

bool stuSectionCandidate::hasVideos() const {
  return any(this->Elements,
             [](const LayoutElementPtr_t &e) { return e->HasVideo; });
}

std::string stuSectionCandidate::text() const {
  std::string Joined;
  for (const auto &Element : this->Elements) {
    if (Element->Text.empty()) continue;
    if (!Joined.empty()) Joined.push_back(' ');
    Joined += Element->Text;
  }
  return normalizeWhitespace(Joined);
}

std::string toString(enuSectionType _type) {
  switch (_type) {
    case enuSectionType::Header:
      return "header";
    case enuSectionType::Hero:
      return "hero";
    case enuSectionType::Content:
      return "content";
    case enuSectionType::Sidebar:
      return "sidebar";
    case enuSectionType::Footer:
      return "footer";
    case enuSectionType::Section:
      return "section";
  }
  return "section";
}

enuSectionType sectionTypeFromString(const std::string &_name) {
  for (auto Type : {enuSectionType::Header, enuSectionType::Hero,
                    enuSectionType::Content, enuSectionType::Sidebar,
                    enuSectionType::Footer, enuSectionType::Section})
    if (toString(Type) == _name) return Type;
  throw exInvalidLayoutData("unknown section type `" + _name + "`");
}

}  // namespace WLA
}  // namespace Flint
