#ifndef __FLINT_WLA__
#define __FLINT_WLA__

#include <stdint.h>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Flint {
namespace WLA {
constexpr float MIN_ITEM_SIZE = 0.1f;

class exSectLaBase : public std::runtime_error {
 public:
  explicit exSectLaBase(const std::string &_message)
      : std::runtime_error(_message) {}
};

/// Malformed or missing geometry/style data. Raised before any partial
/// result is produced.
class exInvalidLayoutData : public exSectLaBase {
 public:
  explicit exInvalidLayoutData(const std::string &_message)
      : exSectLaBase("Invalid layout data: " + _message) {}
};

/// Raised by layout providers when a page could not be rendered.
class exRenderFailure : public exSectLaBase {
 public:
  explicit exRenderFailure(const std::string &_message)
      : exSectLaBase("Render failure: " + _message) {}
};

struct stuSize {
  float Width;
  float Height;

  float area() const {
    return this->isEmpty() ? 0 : this->Width * this->Height;
  }

  bool isEmpty() const {
    return this->Width < MIN_ITEM_SIZE || this->Height < MIN_ITEM_SIZE;
  }

  stuSize(float _w = 0, float _h = 0) : Width(_w), Height(_h) {}

  stuSize scale(float _scale) const {
    return stuSize(this->Width * _scale, this->Height * _scale);
  }
};

struct stuBoundingBox {
  float Top, Left;
  stuSize Size;

  stuBoundingBox(float _top, float _left, float _width, float _height)
      : Top(_top), Left(_left), Size(_width, _height) {}
  stuBoundingBox() : stuBoundingBox(0.f, 0.f, 0.f, 0.f) {}

  static stuBoundingBox fromEdges(float _left, float _top, float _right,
                                  float _bottom) {
    return stuBoundingBox(_top, _left, _right - _left, _bottom - _top);
  }

  float left() const { return this->Left; }
  float top() const { return this->Top; }
  float right() const { return this->Left + this->Size.Width; }
  float bottom() const { return this->Top + this->Size.Height; }

  float width() const { return this->Size.Width; }
  float height() const { return this->Size.Height; }

  float area() const { return this->Size.area(); }
  bool isEmpty() const { return this->Size.isEmpty(); }
  bool isFinite() const {
    return std::isfinite(this->Top) && std::isfinite(this->Left) &&
           std::isfinite(this->Size.Width) && std::isfinite(this->Size.Height);
  }

  void unionWith_(const stuBoundingBox &_other);
  stuBoundingBox unionWith(const stuBoundingBox &_other) const;

  void intersectWith_(const stuBoundingBox &_other);
  stuBoundingBox intersectWith(const stuBoundingBox &_other) const;

  float horizontalOverlap(const stuBoundingBox &_other) const;
  float verticalOverlap(const stuBoundingBox &_other) const;

  /// Vertical distance from the bottom of this box to the top of `_below`.
  /// Negative when the two boxes overlap vertically.
  float verticalGapTo(const stuBoundingBox &_below) const {
    return _below.top() - this->bottom();
  }

  bool contains(const stuBoundingBox &_other) const;

  stuBoundingBox scale(float _scale) const {
    return stuBoundingBox(this->Top * _scale, this->Left * _scale,
                          this->Size.Width * _scale,
                          this->Size.Height * _scale);
  }
};

struct stuBoxBoundedItem {
  stuBoundingBox BoundingBox;
  stuBoxBoundedItem() {}
  stuBoxBoundedItem(const stuBoundingBox &_boundingBox)
      : BoundingBox(_boundingBox) {}
};

struct stuEdges {
  float Top, Right, Bottom, Left;
  stuEdges(float _all = 0.f)
      : Top(_all), Right(_all), Bottom(_all), Left(_all) {}
  stuEdges(float _top, float _right, float _bottom, float _left)
      : Top(_top), Right(_right), Bottom(_bottom), Left(_left) {}

  bool isZero() const {
    return this->Top <= 0.f && this->Right <= 0.f && this->Bottom <= 0.f &&
           this->Left <= 0.f;
  }
};

std::string normalizeColor(const std::string &_color);
bool isTransparentColor(const std::string &_color);
std::string normalizeWhitespace(const std::string &_text);
/// Character counts and cuts over UTF-8 text, never splitting a code point.
size_t utf8Length(const std::string &_text);
std::string utf8Prefix(const std::string &_text, size_t _length);

struct stuElementStyle {
  std::string BackgroundColor;
  stuEdges BorderWidth;
  stuEdges Margin;
  stuEdges Padding;
  bool Visible = true;

  bool hasOpaqueBackground() const {
    return !isTransparentColor(this->BackgroundColor);
  }
  bool hasBorder() const { return !this->BorderWidth.isZero(); }
  bool isDistinguishing() const {
    return this->hasOpaqueBackground() || this->hasBorder();
  }
};

constexpr int32_t NO_PARENT = -1;

struct stuLayoutElement : public stuBoxBoundedItem {
  std::string Tag;
  stuElementStyle Style;
  std::string Text;
  bool HasText = false;
  bool HasImage = false;
  bool HasVideo = false;
  int32_t DomOrder = 0;
  int32_t ParentDomOrder = NO_PARENT;
  std::string RawHtml;

  bool hasContent() const {
    return this->HasText || this->HasImage || this->HasVideo;
  }
};
typedef std::shared_ptr<const stuLayoutElement> LayoutElementPtr_t;
typedef std::vector<LayoutElementPtr_t> LayoutElementPtrVector_t;

struct stuLayoutSnapshot {
  std::string Url;
  stuSize PageSize;
  LayoutElementPtrVector_t Elements;

  /// Page size as reported by the provider, or the extent of the elements
  /// along any axis the provider left at zero.
  stuSize effectivePageSize() const;
};

struct stuSectionCandidate : public stuBoxBoundedItem {
  LayoutElementPtrVector_t Elements;

  explicit stuSectionCandidate(const LayoutElementPtr_t &_seed)
      : stuBoxBoundedItem(_seed->BoundingBox), Elements{_seed} {}

  void append_(const LayoutElementPtr_t &_element);
  const LayoutElementPtr_t &last() const { return this->Elements.back(); }
  size_t size() const { return this->Elements.size(); }
  bool hasImages() const;
  bool hasVideos() const;
  /// Member texts joined by single spaces with whitespace runs collapsed.
  std::string text() const;
};
typedef std::vector<stuSectionCandidate> SectionCandidateVector_t;

enum class enuSectionType { Header, Hero, Content, Sidebar, Footer, Section };

std::string toString(enuSectionType _type);
enuSectionType sectionTypeFromString(const std::string &_name);

struct stuSectionMetadata {
  bool HasImages = false;
  bool HasVideos = false;
  size_t ElementCount = 0;
};

struct stuSection : public stuBoxBoundedItem {
  size_t ID = 0;
  enuSectionType Type = enuSectionType::Section;
  std::string Content;
  stuSectionMetadata Metadata;
  std::string Html;
  std::vector<std::string> HtmlElements;
  std::vector<int32_t> MemberDomOrders;
};
typedef std::vector<stuSection> SectionVector_t;

}  // namespace WLA
}  // namespace Flint

#endif  // __FLINT_WLA__
