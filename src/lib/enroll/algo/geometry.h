/**
 * @file geometry.h
 * @ingroup enroll_algo
 * @brief Axis-aligned face box primitives: IoU, clamping and conversion to normalized coordinates.
 */

#pragma once

#include "internal/opencv_headers.h" // IWYU pragma: keep
#include "types.h"

namespace enroll::algo {

/**
 * @brief Face box produced by a detector engine, in source image pixels.
 *
 * @details
 * @c box uses OpenCV's (x, y, width, height) convention with float pixels.
 * @c score is the face classification score of the detector.
 */
struct Detection {
    cv::Rect2f box;
    float score = 0.0f;
};

/**
 * @brief Intersection over union of two axis-aligned boxes.
 * @return Value in [0, 1]; 0 if the union is empty.
 */
float box_iou(const cv::Rect2f& a, const cv::Rect2f& b) noexcept;

/**
 * @brief Intersects @p r with the image rectangle [0, w) x [0, h).
 * @return Clamped rectangle; width/height are 0 if nothing remains.
 */
cv::Rect2f clamp_box(const cv::Rect2f& r, int w, int h) noexcept;

/**
 * @brief Converts a pixel box to fractions of the image dimensions.
 *
 * @pre @p w > 0 and @p h > 0.
 */
BoundingBox to_normalized(const cv::Rect2f& r, int w, int h) noexcept;

/**
 * @brief Converts a normalized box back to an integer pixel rectangle clamped to the image.
 */
cv::Rect to_pixels(const BoundingBox& b, int w, int h) noexcept;

} // namespace enroll::algo
