#ifndef __FLINT_COMMON_ALGORITHMS__
#define __FLINT_COMMON_ALGORITHMS__

#include <stdint.h>

#include <algorithm>
#include <iterator>
#include <numeric>
#include <utility>
#include <vector>

#include "type_traits.hpp"

namespace Flint {
namespace Common {

template <typename T0, typename Functor_t>
auto map(const T0 &v, Functor_t f) {
  using ContainerTraits_t = stuContainerTypeTraits<T0>;
  using T1 = RemoveConstRef_t<decltype(std::declval<Functor_t>()(
      std::declval<typename ContainerTraits_t::ElementType_t>()))>;
  std::vector<T1> Result;
  Result.reserve(v.size());
  std::transform(v.begin(), v.end(), std::back_inserter(Result), f);
  return Result;
}

/// Left fold. `f(State, Item)` returns the next state; the state is moved
/// through every step so large accumulators are not copied.
template <typename T0, typename State_t, typename Functor_t>
State_t foldLeft(const T0 &v, State_t _initial, Functor_t f) {
  using ContainerTraits_t = stuContainerTypeTraits<T0>;
  static_assert(ContainerTraits_t::IsContainer,
                "`foldLeft` only works on containers");
  State_t State = std::move(_initial);
  for (const auto &Item : v) State = f(std::move(State), Item);
  return State;
}

template <typename T0, typename Functor_t>
auto max(const T0 &v, Functor_t f) {
  using ContainerTraits_t = stuContainerTypeTraits<T0>;
  static_assert(ContainerTraits_t::IsContainer,
                "`max` only works on containers");
  using T1 = typename ContainerTraits_t::ElementBareType_t;
  using T2 =
      BareType_t<decltype(std::declval<Functor_t>()(std::declval<T1>()))>;
  if (v.empty()) return T2();
  return f(*std::max_element(
      v.begin(), v.end(),
      [&f](const T1 &a, const T1 &b) { return f(a) < f(b); }));
}

template <typename T0, typename Functor_t>
size_t count(const T0 &v, Functor_t f) {
  using ContainerTraits_t = stuContainerTypeTraits<T0>;
  static_assert(ContainerTraits_t::IsContainer,
                "`count` only works on containers");
  return static_cast<size_t>(std::count_if(v.begin(), v.end(), f));
}

template <typename T0, typename Functor_t>
bool any(const T0 &v, Functor_t f) {
  using ContainerTraits_t = stuContainerTypeTraits<T0>;
  static_assert(ContainerTraits_t::IsContainer,
                "`any` only works on containers");
  if (v.empty()) return false;
  return std::any_of(v.begin(), v.end(), f);
}

}  // namespace Common
}  // namespace Flint

#endif  //__FLINT_COMMON_ALGORITHMS__
