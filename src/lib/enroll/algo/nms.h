/**
 * @file nms.h
 * @ingroup enroll_algo
 * @brief Greedy non-maximum suppression for face boxes.
 */

#pragma once

#include "algo/geometry.h"

#include <vector>

namespace enroll::algo {

/**
 * @brief Score-sorted greedy NMS using @ref box_iou.
 *
 * @param dets Input detections.
 * @param iou_thr IoU at or above which the lower-scored box is suppressed.
 * @return Kept detections in descending score order.
 *
 * @par Special cases
 *  - iou_thr <= 0 : returns all detections sorted by score (no suppression)
 *  - iou_thr >= 1 : returns the single best detection
 */
std::vector<Detection> nms_boxes(const std::vector<Detection>& dets, float iou_thr);

} // namespace enroll::algo
