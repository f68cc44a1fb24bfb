/**
 * @file chw_preprocess.h
 * @ingroup enroll_internal
 * @brief BGR U8 -> CHW float32 tensor packing with per-channel normalization.
 *
 * Output planes follow @p to_rgb: B,G,R when false, R,G,B when true. @p mean and @p inv_std are
 * given in output plane order. Each value is @c (v - mean[c]) * inv_std[c].
 */

#pragma once

#include "internal/opencv_headers.h" // IWYU pragma: keep

#include <cstddef>
#include <cstdint>

namespace enroll::internal {

/// @pre @p bgr is CV_8UC3 and @p dst_chw holds 3*rows*cols floats.
inline void bgr_u8_to_chw_f32_same_size(const cv::Mat& bgr, float* dst_chw, const float mean[3],
                                        const float inv_std[3], bool to_rgb) noexcept {
    const int H = bgr.rows;
    const int W = bgr.cols;
    const std::size_t plane = static_cast<std::size_t>(H) * static_cast<std::size_t>(W);

    // Source channel feeding each output plane.
    const int src_c[3] = {to_rgb ? 2 : 0, 1, to_rgb ? 0 : 2};

    float* P0 = dst_chw;
    float* P1 = dst_chw + plane;
    float* P2 = dst_chw + 2 * plane;

    for (int y = 0; y < H; ++y) {
        const std::uint8_t* p = bgr.ptr<std::uint8_t>(y);
        const std::size_t row = static_cast<std::size_t>(y) * static_cast<std::size_t>(W);
        for (int x = 0; x < W; ++x, p += 3) {
            const std::size_t idx = row + static_cast<std::size_t>(x);
            P0[idx] = (float(p[src_c[0]]) - mean[0]) * inv_std[0];
            P1[idx] = (float(p[src_c[1]]) - mean[1]) * inv_std[1];
            P2[idx] = (float(p[src_c[2]]) - mean[2]) * inv_std[2];
        }
    }
}

/// @throws cv::Exception if resizing fails.
inline void bgr_u8_to_chw_f32_resize(const cv::Mat& bgr, int dst_w, int dst_h, float* dst_chw, const float mean[3],
                                     const float inv_std[3], bool to_rgb = false) {
    if (bgr.cols == dst_w && bgr.rows == dst_h) {
        bgr_u8_to_chw_f32_same_size(bgr, dst_chw, mean, inv_std, to_rgb);
        return;
    }
    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(dst_w, dst_h), 0, 0, cv::INTER_LINEAR);
    bgr_u8_to_chw_f32_same_size(resized, dst_chw, mean, inv_std, to_rgb);
}

} // namespace enroll::internal
