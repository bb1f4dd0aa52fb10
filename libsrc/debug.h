#ifndef __FLINT_SECTLA_DEBUG__
#define __FLINT_SECTLA_DEBUG__

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "type_traits.hpp"
#include "wla.h"

namespace Flint {
namespace SectLA {

constexpr float DEBUG_SCALE_FACTOR = 0.5f;
constexpr float MAX_DEBUG_IMAGE_SIDE = 8000.f;

struct stuDebugBox {
  Flint::WLA::stuBoundingBox Box;
  std::string Label;
};
typedef std::vector<stuDebugBox> DebugBoxVector_t;

/// How each pipeline record is drawn: its box and a short caption.
template <typename T>
struct stuDebugBoxTraits {};

template <typename T>
struct stuDebugBoxTraits<std::shared_ptr<T>> {
  static stuDebugBox of(const std::shared_ptr<T>& _item) {
    return stuDebugBoxTraits<Flint::Common::RemoveConstRef_t<T>>::of(*_item);
  }
};

template <>
struct stuDebugBoxTraits<Flint::WLA::stuLayoutElement> {
  static stuDebugBox of(const Flint::WLA::stuLayoutElement& _element) {
    return {_element.BoundingBox,
            _element.Tag + "#" + std::to_string(_element.DomOrder)};
  }
};

template <>
struct stuDebugBoxTraits<Flint::WLA::stuSectionCandidate> {
  static stuDebugBox of(const Flint::WLA::stuSectionCandidate& _candidate) {
    return {_candidate.BoundingBox,
            "#" + std::to_string(_candidate.Elements.front()->DomOrder) + "+" +
                std::to_string(_candidate.size() - 1)};
  }
};

template <>
struct stuDebugBoxTraits<Flint::WLA::stuSection> {
  static stuDebugBox of(const Flint::WLA::stuSection& _section) {
    return {_section.BoundingBox,
            std::to_string(_section.ID) + " " + toString(_section.Type)};
  }
};

struct stuSectLaDebugImageData;
/// A page-sized canvas on which groups of boxes are drawn, one color per
/// group. Default constructed images are inert: every call is a no-op.
class clsSectLaDebugImage {
 private:
  std::shared_ptr<stuSectLaDebugImageData> Data;

 public:
  clsSectLaDebugImage(const Flint::WLA::stuSize& _pageSize,
                      const std::string& _debugOutputPath,
                      const std::string& _basename);
  clsSectLaDebugImage();

  bool isActive() const { return this->Data.get() != nullptr; }

  /// Every argument is a container drawn as its own color group.
  template <typename... Containers_t>
  clsSectLaDebugImage& add(const Containers_t&... _groups) {
    (..., this->draw(toDebugBoxes(_groups)));
    return *this;
  }

  clsSectLaDebugImage& draw(const DebugBoxVector_t& _boxes);

  /// Writes `<basename>_<tag>.png` into the debug output path.
  clsSectLaDebugImage& save(const std::string& _tag);

 private:
  template <typename Container_t>
  static DebugBoxVector_t toDebugBoxes(const Container_t& _items) {
    static_assert(Flint::Common::IsContainer<Container_t>,
                  "debug images are drawn from containers");
    typedef typename Flint::Common::stuContainerTypeTraits<
        Container_t>::ElementBareType_t Item_t;
    DebugBoxVector_t Boxes;
    Boxes.reserve(_items.size());
    for (const auto& Item : _items)
      Boxes.push_back(stuDebugBoxTraits<Item_t>::of(Item));
    return Boxes;
  }
};

struct stuSectLaDebugData;
/// Opt-in diagnostics for detectors, keyed by the address of the object being
/// debugged. Nothing is traced or drawn for objects that were not registered.
class clsSectLaDebug {
 private:
  std::string DebugOutputPath;
  std::map<const void*, stuSectLaDebugData> DebugData;
  std::mutex Lock;

 private:
  clsSectLaDebug();

 public:
  static clsSectLaDebug& instance();

 public:
  void registerObject(const void* _object, const std::string& _basename);
  void unregisterObject(const void* _object);
  bool isObjectRegistered(const void* _object);
  void setPageSize(const void* _object, const Flint::WLA::stuSize& _pageSize);

  /// `_message` is only evaluated for registered objects.
  void trace(const void* _object, const std::function<std::string()>& _message);

  clsSectLaDebugImage createImage(const void* _object);

  void setDebugOutputPath(const std::string& _debugOutputPath);
};

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_DEBUG__
