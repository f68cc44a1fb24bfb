/**
 * @file nms.cpp
 * @ingroup enroll_algo
 * @brief Implementation of greedy box NMS.
 *
 * @details
 * Face detectors emit at most a few hundred candidates per image, so the quadratic scan is kept
 * simple: an overlap pre-check rejects disjoint pairs before the IoU division.
 */

#include "algo/nms.h"

#include <algorithm>
#include <cstddef>
#include <numeric>

namespace enroll::algo {

namespace {

inline bool overlaps(const cv::Rect2f& a, const cv::Rect2f& b) noexcept {
    return !(a.x + a.width <= b.x || b.x + b.width <= a.x || a.y + a.height <= b.y || b.y + b.height <= a.y);
}

} // namespace

std::vector<Detection> nms_boxes(const std::vector<Detection>& dets, float iou_thr) {
    const std::size_t n = dets.size();
    if (n == 0) return {};

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return dets[a].score > dets[b].score; });

    if (iou_thr >= 1.0f) return {dets[order.front()]};

    std::vector<Detection> out;
    out.reserve(n);

    if (iou_thr <= 0.0f) {
        for (std::size_t i : order)
            out.push_back(dets[i]);
        return out;
    }

    std::vector<char> removed(n, 0);
    for (std::size_t oi = 0; oi < n; ++oi) {
        const std::size_t i = order[oi];
        if (removed[i]) continue;
        out.push_back(dets[i]);

        for (std::size_t oj = oi + 1; oj < n; ++oj) {
            const std::size_t j = order[oj];
            if (removed[j]) continue;
            if (!overlaps(dets[i].box, dets[j].box)) continue;
            if (box_iou(dets[i].box, dets[j].box) >= iou_thr) removed[j] = 1;
        }
    }
    return out;
}

} // namespace enroll::algo
