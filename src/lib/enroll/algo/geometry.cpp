/**
 * @file geometry.cpp
 * @ingroup enroll_algo
 * @brief Implementation of the axis-aligned box helpers.
 */

#include "algo/geometry.h"

#include <algorithm>
#include <cmath>

namespace enroll::algo {

float box_iou(const cv::Rect2f& a, const cv::Rect2f& b) noexcept {
    const float ix1 = std::max(a.x, b.x);
    const float iy1 = std::max(a.y, b.y);
    const float ix2 = std::min(a.x + a.width, b.x + b.width);
    const float iy2 = std::min(a.y + a.height, b.y + b.height);

    const float iw = std::max(0.0f, ix2 - ix1);
    const float ih = std::max(0.0f, iy2 - iy1);
    const float inter = iw * ih;

    const float uni = std::max(0.0f, a.width) * std::max(0.0f, a.height) +
                      std::max(0.0f, b.width) * std::max(0.0f, b.height) - inter;
    if (uni <= 0.0f) return 0.0f;
    return inter / uni;
}

cv::Rect2f clamp_box(const cv::Rect2f& r, int w, int h) noexcept {
    const float x1 = std::clamp(r.x, 0.0f, (float)w);
    const float y1 = std::clamp(r.y, 0.0f, (float)h);
    const float x2 = std::clamp(r.x + r.width, 0.0f, (float)w);
    const float y2 = std::clamp(r.y + r.height, 0.0f, (float)h);
    return cv::Rect2f(x1, y1, std::max(0.0f, x2 - x1), std::max(0.0f, y2 - y1));
}

BoundingBox to_normalized(const cv::Rect2f& r, int w, int h) noexcept {
    const cv::Rect2f c = clamp_box(r, w, h);
    BoundingBox b;
    b.x = (double)c.x / (double)w;
    b.y = (double)c.y / (double)h;
    b.width = (double)c.width / (double)w;
    b.height = (double)c.height / (double)h;
    return b;
}

cv::Rect to_pixels(const BoundingBox& b, int w, int h) noexcept {
    const int x1 = std::clamp((int)std::floor(b.x * w), 0, std::max(0, w));
    const int y1 = std::clamp((int)std::floor(b.y * h), 0, std::max(0, h));
    const int x2 = std::clamp((int)std::ceil((b.x + b.width) * w), x1, std::max(0, w));
    const int y2 = std::clamp((int)std::ceil((b.y + b.height) * h), y1, std::max(0, h));
    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

} // namespace enroll::algo
