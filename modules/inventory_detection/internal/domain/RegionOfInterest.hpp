#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <string>

namespace HotbarScan::Domain {

// Integer pixel rectangle of one grid slot. Immutable once produced.
class RegionOfInterest {
  public:
    RegionOfInterest() = default;

    RegionOfInterest(int x, int y, int width, int height, std::string label = {}, int index = -1)
        : x_(x), y_(y), width_(width), height_(height), label_(std::move(label)), index_(index) {}

    int getX() const { return x_; }
    int getY() const { return y_; }
    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    const std::string& getLabel() const { return label_; }
    int getIndex() const { return index_; }

    int area() const { return width_ * height_; }
    bool isEmpty() const { return width_ <= 0 || height_ <= 0; }

    Types::Rect toRect() const { return Types::Rect(x_, y_, width_, height_); }

    bool fitsWithin(const cv::Size& size) const {
        return x_ >= 0 && y_ >= 0 && x_ + width_ <= size.width && y_ + height_ <= size.height;
    }

    // Intersection over union, 0 when either rectangle is empty.
    double iou(const RegionOfInterest& other) const {
        Types::Rect intersection = toRect() & other.toRect();
        double inter = static_cast<double>(intersection.area());
        double uni = static_cast<double>(area()) + other.area() - inter;
        return uni > 0.0 ? inter / uni : 0.0;
    }

    bool sameBounds(const RegionOfInterest& other) const {
        return x_ == other.x_ && y_ == other.y_ && width_ == other.width_ && height_ == other.height_;
    }

    // Clips the rectangle to the given image size, keeping label and index.
    RegionOfInterest clampedTo(const cv::Size& size) const {
        int left = std::clamp(x_, 0, size.width);
        int top = std::clamp(y_, 0, size.height);
        int right = std::clamp(x_ + width_, 0, size.width);
        int bottom = std::clamp(y_ + height_, 0, size.height);
        return RegionOfInterest(left, top, right - left, bottom - top, label_, index_);
    }

  private:
    int x_ = 0;
    int y_ = 0;
    int width_ = 0;
    int height_ = 0;
    std::string label_;
    int index_ = -1;
};

}  // namespace HotbarScan::Domain
