#ifndef __FLINT_COMMON_TYPE_TRAITS__
#define __FLINT_COMMON_TYPE_TRAITS__

#include <type_traits>

namespace Flint {
namespace Common {

template <typename T>
using BareType_t =
    std::remove_pointer_t<std::remove_reference_t<std::remove_cv_t<T>>>;

template <typename T>
using RemoveConstRef_t = std::remove_const_t<std::remove_reference_t<T>>;

template <typename T, typename = void>
struct stuContainerTypeTraits {
  typedef T ElementType_t;
  typedef BareType_t<ElementType_t> ElementBareType_t;
  static constexpr bool IsContainer = false;
};

template <typename T>
struct stuContainerTypeTraits<T, decltype((void)std::declval<T>().begin())> {
  using ElementType_t = decltype(*std::declval<T>().begin());
  typedef RemoveConstRef_t<ElementType_t> ElementBareType_t;
  static constexpr bool IsContainer = true;
};

template <typename T>
constexpr bool IsContainer = stuContainerTypeTraits<T>::IsContainer;

}  // namespace Common
}  // namespace Flint

#endif  // __FLINT_COMMON_TYPE_TRAITS__
