#ifndef __FLINT_SECTLA_OPTIONS__
#define __FLINT_SECTLA_OPTIONS__

#include <stddef.h>

namespace Flint {
namespace SectLA {

constexpr float DEFAULT_GAP_THRESHOLD_PX = 20.f;
constexpr float DEFAULT_MIN_HEIGHT_PX = 30.f;
constexpr float DEFAULT_MIN_WIDTH_PX = 100.f;

constexpr float DEFAULT_HEADER_MAX_TOP_PX = 150.f;
constexpr float DEFAULT_HEADER_MAX_HEIGHT_PX = 150.f;
constexpr size_t DEFAULT_HERO_MAX_INDEX = 1;
constexpr float DEFAULT_HERO_MIN_HEIGHT_PX = 300.f;
constexpr float DEFAULT_FOOTER_SMALL_ELEMENT_MAX_HEIGHT_PX = 100.f;
constexpr float DEFAULT_FOOTER_MIN_SMALL_ELEMENT_RATIO = 0.5f;
constexpr float DEFAULT_SIDEBAR_MAX_WIDTH_RATIO = 0.3f;
// In characters, not bytes
constexpr size_t DEFAULT_SUBSTANTIAL_TEXT_LENGTH = 100;

/// Tunables of a single detection run. Passed by value into every stage so
/// concurrent runs with different tuning never share state.
struct stuDetectionOptions {
  float GapThresholdPx = DEFAULT_GAP_THRESHOLD_PX;
  float MinHeightPx = DEFAULT_MIN_HEIGHT_PX;
  float MinWidthPx = DEFAULT_MIN_WIDTH_PX;

  float HeaderMaxTopPx = DEFAULT_HEADER_MAX_TOP_PX;
  float HeaderMaxHeightPx = DEFAULT_HEADER_MAX_HEIGHT_PX;
  size_t HeroMaxIndex = DEFAULT_HERO_MAX_INDEX;
  float HeroMinHeightPx = DEFAULT_HERO_MIN_HEIGHT_PX;
  float FooterSmallElementMaxHeightPx =
      DEFAULT_FOOTER_SMALL_ELEMENT_MAX_HEIGHT_PX;
  float FooterMinSmallElementRatio = DEFAULT_FOOTER_MIN_SMALL_ELEMENT_RATIO;
  float SidebarMaxWidthRatio = DEFAULT_SIDEBAR_MAX_WIDTH_RATIO;
  size_t SubstantialTextLength = DEFAULT_SUBSTANTIAL_TEXT_LENGTH;
};

}  // namespace SectLA
}  // namespace Flint

#endif  // __FLINT_SECTLA_OPTIONS__
