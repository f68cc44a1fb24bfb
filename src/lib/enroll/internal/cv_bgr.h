/**
 * @file cv_bgr.h
 * @ingroup enroll_internal
 * @brief Bridges between @ref enroll::Image and OpenCV BGR matrices.
 *
 * - @ref enroll::internal::BgrMat::from : Image -> CV_8UC3 BGR (zero-copy for BGR_U8 input).
 * - @ref enroll::internal::image_from_mat : CV_8UC3 BGR -> Image sharing the matrix buffer.
 */

#pragma once

#include "image.h"
#include "internal/opencv_headers.h" // IWYU pragma: keep
#include "status.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace enroll::internal {

/**
 * @brief BGR matrix that keeps the source @ref enroll::Image alive when it is a view of it.
 */
class BgrMat final {
  public:
    BgrMat() = default;

    [[nodiscard]] static Result<BgrMat> from(const Image& img) noexcept {
        const auto& v = img.view();
        if (!v.is_valid()) {
            return Result<BgrMat>::Err(Status::Invalid("BgrMat::from: invalid Image"));
        }

        BgrMat out;

        if (v.format == PixelFormat::BGR_U8) {
            out.hold_ = img;
            out.mat_ = cv::Mat(v.height, v.width, CV_8UC3, const_cast<std::uint8_t*>(v.data), v.stride_bytes);
            return Result<BgrMat>::Ok(std::move(out));
        }

        const int code = cvt_code_to_bgr_(v.format);
        if (code < 0) {
            return Result<BgrMat>::Err(Status::Unsupported("BgrMat::from: unsupported PixelFormat"));
        }

        const int src_type = (v.channels() == 4) ? CV_8UC4 : CV_8UC3;
        cv::Mat src(v.height, v.width, src_type, const_cast<std::uint8_t*>(v.data), v.stride_bytes);

        try {
            cv::cvtColor(src, out.mat_, code);
        } catch (const cv::Exception& e) {
            return Result<BgrMat>::Err(Status::Internal(std::string("BgrMat::from: cvtColor failed: ") + e.what()));
        } catch (const std::bad_alloc&) {
            return Result<BgrMat>::Err(Status::OutOfMemory("BgrMat::from: bad_alloc"));
        }

        return Result<BgrMat>::Ok(std::move(out));
    }

    [[nodiscard]] const cv::Mat& mat() const noexcept {
        return mat_;
    }

  private:
    [[nodiscard]] static int cvt_code_to_bgr_(PixelFormat f) noexcept {
        switch (f) {
        case PixelFormat::RGB_U8:
            return cv::COLOR_RGB2BGR;
        case PixelFormat::RGBA_U8:
            return cv::COLOR_RGBA2BGR;
        case PixelFormat::BGRA_U8:
            return cv::COLOR_BGRA2BGR;
        default:
            return -1;
        }
    }

    Image hold_{};
    cv::Mat mat_{};
};

/**
 * @brief Wraps a continuous or strided CV_8UC3 matrix as a BGR_U8 @ref enroll::Image.
 *
 * The matrix header is moved into the owner token, so the pixels live as long as the image.
 */
[[nodiscard]] inline Result<Image> image_from_mat(cv::Mat bgr) noexcept {
    if (bgr.empty() || bgr.type() != CV_8UC3) {
        return Result<Image>::Err(Status::Invalid("image_from_mat: expected non-empty CV_8UC3"));
    }
    try {
        auto hold = std::make_shared<cv::Mat>(std::move(bgr));
        const cv::Mat& m = *hold;
        return Result<Image>::Ok(Image::wrap(PixelFormat::BGR_U8, m.cols, m.rows, m.ptr<std::uint8_t>(0),
                                             static_cast<std::size_t>(m.step[0]), std::static_pointer_cast<void>(hold)));
    } catch (const std::bad_alloc&) {
        return Result<Image>::Err(Status::OutOfMemory("image_from_mat: bad_alloc"));
    }
}

} // namespace enroll::internal
