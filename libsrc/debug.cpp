#include "debug.h"

#include <algorithm>
#include <iostream>
#include <opencv4/opencv2/opencv.hpp>

namespace Flint {
namespace SectLA {
using namespace Flint::WLA;

struct stuSectLaDebugData {
  std::string Basename;
  stuSize PageSize;
};

clsSectLaDebug::clsSectLaDebug() {}

clsSectLaDebug& clsSectLaDebug::instance() {
  static clsSectLaDebug Instance;
  return Instance;
}

void clsSectLaDebug::registerObject(const void* _object,
                                    const std::string& _basename) {
  std::lock_guard<std::mutex> Guard(this->Lock);
  this->DebugData.emplace(_object, stuSectLaDebugData{_basename, stuSize()});
}

void clsSectLaDebug::unregisterObject(const void* _object) {
  std::lock_guard<std::mutex> Guard(this->Lock);
  this->DebugData.erase(_object);
}

bool clsSectLaDebug::isObjectRegistered(const void* _object) {
  std::lock_guard<std::mutex> Guard(this->Lock);
  return this->DebugData.count(_object) > 0;
}

void clsSectLaDebug::setPageSize(const void* _object,
                                 const stuSize& _pageSize) {
  std::lock_guard<std::mutex> Guard(this->Lock);
  auto Iterator = this->DebugData.find(_object);
  if (Iterator != this->DebugData.end()) Iterator->second.PageSize = _pageSize;
}

void clsSectLaDebug::trace(const void* _object,
                           const std::function<std::string()>& _message) {
  std::string Basename;
  {
    std::lock_guard<std::mutex> Guard(this->Lock);
    auto Iterator = this->DebugData.find(_object);
    if (Iterator == this->DebugData.end()) return;
    Basename = Iterator->second.Basename;
  }
  std::cerr << "[" << Basename << "] " << _message() << std::endl;
}

void clsSectLaDebug::setDebugOutputPath(const std::string& _debugOutputPath) {
  std::lock_guard<std::mutex> Guard(this->Lock);
  this->DebugOutputPath = _debugOutputPath;
}

clsSectLaDebugImage clsSectLaDebug::createImage(const void* _object) {
  std::lock_guard<std::mutex> Guard(this->Lock);
  auto Iterator = this->DebugData.find(_object);
  if (Iterator == this->DebugData.end()) return clsSectLaDebugImage();
  return clsSectLaDebugImage(Iterator->second.PageSize, this->DebugOutputPath,
                             Iterator->second.Basename);
}

struct stuSectLaDebugImageData {
  cv::Mat Canvas;
  std::string FilePrefix;
  float Scale;
  size_t NextGroup = 0;
};

clsSectLaDebugImage::clsSectLaDebugImage() {}

clsSectLaDebugImage::clsSectLaDebugImage(const stuSize& _pageSize,
                                         const std::string& _debugOutputPath,
                                         const std::string& _basename) {
  if (_pageSize.isEmpty()) return;
  this->Data = std::make_shared<stuSectLaDebugImageData>();
  this->Data->Scale =
      std::min(DEBUG_SCALE_FACTOR,
               MAX_DEBUG_IMAGE_SIDE / std::max(_pageSize.Width, _pageSize.Height));
  this->Data->FilePrefix =
      _debugOutputPath.empty() ? _basename : _debugOutputPath + "/" + _basename;

  auto CanvasSize = _pageSize.scale(this->Data->Scale);
  this->Data->Canvas =
      cv::Mat(std::max(1, static_cast<int>(CanvasSize.Height)),
              std::max(1, static_cast<int>(CanvasSize.Width)), CV_8UC3,
              cv::Scalar(255, 255, 255));
}

// BGR
const cv::Scalar GROUP_COLORS[] = {
    cv::Scalar(40, 120, 220), cv::Scalar(60, 160, 60), cv::Scalar(180, 80, 160),
    cv::Scalar(30, 170, 200), cv::Scalar(200, 120, 40)};
constexpr size_t GROUP_COLORS_COUNT = sizeof GROUP_COLORS / sizeof GROUP_COLORS[0];

clsSectLaDebugImage& clsSectLaDebugImage::draw(const DebugBoxVector_t& _boxes) {
  if (this->isActive() == false || _boxes.empty()) return *this;

  const cv::Scalar& Color =
      GROUP_COLORS[this->Data->NextGroup++ % GROUP_COLORS_COUNT];
  cv::Rect Page(0, 0, this->Data->Canvas.cols, this->Data->Canvas.rows);
  for (const auto& DebugBox : _boxes) {
    auto Scaled = DebugBox.Box.scale(this->Data->Scale);
    cv::Rect Rect = cv::Rect(static_cast<int>(Scaled.left()),
                             static_cast<int>(Scaled.top()),
                             static_cast<int>(Scaled.width()),
                             static_cast<int>(Scaled.height())) &
                    Page;
    if (Rect.width < 2 || Rect.height < 2) continue;

    cv::Mat Region = this->Data->Canvas(Rect);
    cv::Mat Tinted(Region.size(), Region.type(), Color);
    cv::addWeighted(Region, 0.7, Tinted, 0.3, 0, Region);
    cv::rectangle(this->Data->Canvas, Rect, Color * 0.5, 1);
    cv::putText(this->Data->Canvas, DebugBox.Label,
                cv::Point(Rect.x + 3, Rect.y + 12), cv::FONT_HERSHEY_PLAIN, 0.8,
                cv::Scalar(0, 0, 0), 1);
  }
  return *this;
}

clsSectLaDebugImage& clsSectLaDebugImage::save(const std::string& _tag) {
  if (this->isActive() == false) return *this;

  auto FileName = this->Data->FilePrefix + "_" + _tag + ".png";
  if (cv::imwrite(FileName, this->Data->Canvas) == false)
    std::cerr << "Unable to write debug image: " << FileName << std::endl;
  return *this;
}

}  // namespace SectLA
}  // namespace Flint
