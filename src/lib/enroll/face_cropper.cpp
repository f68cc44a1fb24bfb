/**
 * @file face_cropper.cpp
 * @brief Crop region geometry and OpenCV rendering/encoding of the enrollment crop.
 *
 * Geometry (all in source pixels, fractional):
 *  1) box -> pixels
 *  2) pad each side by padding_ratio of the box size, clamped to the image
 *  3) shrink width (too wide) or set height from width (too tall/narrow) to reach the target ratio,
 *     keeping the centre, then clamp the origin so the region stays inside the image
 *
 * Rendering maps the region onto the output canvas with a single scale + translation warp, so the
 * region fills the canvas exactly and no letterboxing occurs.
 */

#include "face_cropper.h"

#include "internal/cv_bgr.h"
#include "internal/opencv_headers.h" // IWYU pragma: keep

#include <algorithm>
#include <cmath>
#include <exception>
#include <new>
#include <string>
#include <utility>
#include <vector>

namespace enroll {

namespace {

inline double clamp_origin_(double v, double size, double limit) noexcept {
    return std::max(0.0, std::min(v, limit - size));
}

} // namespace

int CropParams::output_height() const noexcept {
    if (!(target_aspect_ratio > 0.0)) return 0;
    return static_cast<int>(std::lround(static_cast<double>(output_width) / target_aspect_ratio));
}

Result<CropRegion> compute_crop_region(const ImageDimensions& dims, const BoundingBox& bbox,
                                       const CropParams& params) noexcept {
    if (dims.width <= 0 || dims.height <= 0) {
        return Result<CropRegion>::Err(Status::Invalid("compute_crop_region: non-positive image dimensions"));
    }
    if (!bbox.is_valid()) {
        return Result<CropRegion>::Err(Status::Invalid("compute_crop_region: bounding box outside [0,1]"));
    }
    if (!(params.target_aspect_ratio > 0.0) || !(params.padding_ratio >= 0.0)) {
        return Result<CropRegion>::Err(Status::Invalid("compute_crop_region: bad ratio/padding parameters"));
    }

    const double img_w = static_cast<double>(dims.width);
    const double img_h = static_cast<double>(dims.height);
    const double target = params.target_aspect_ratio;

    double x = bbox.x * img_w;
    double y = bbox.y * img_h;
    double w = bbox.width * img_w;
    double h = bbox.height * img_h;

    const double pad_x = w * params.padding_ratio;
    const double pad_y = h * params.padding_ratio;

    x = std::max(0.0, x - pad_x);
    w = std::min(img_w - x, w + 2.0 * pad_x);
    y = std::max(0.0, y - pad_y);
    h = std::min(img_h - y, h + 2.0 * pad_y);

    if (!(w > 0.0) || !(h > 0.0)) {
        return Result<CropRegion>::Err(Status::Invalid("compute_crop_region: empty padded region"));
    }

    if (w / h > target) {
        const double nw = h * target;
        x += (w - nw) * 0.5;
        w = nw;
    } else {
        double nh = w / target;
        if (nh > img_h) {
            // Too narrow to grow vertically: cap the height, give the width back.
            nh = img_h;
            const double nw = nh * target;
            x += (w - nw) * 0.5;
            w = nw;
        }
        y += (h - nh) * 0.5;
        h = nh;
    }

    x = clamp_origin_(x, w, img_w);
    y = clamp_origin_(y, h, img_h);

    if (w < 1.0 || h < 1.0) {
        return Result<CropRegion>::Err(Status::Invalid("compute_crop_region: region smaller than one pixel"));
    }

    CropRegion r;
    r.x = x;
    r.y = y;
    r.width = w;
    r.height = h;
    return Result<CropRegion>::Ok(r);
}

Result<CropOutput> crop_face(const Image& image, const BoundingBox& bbox, const CropParams& params) noexcept {
    if (!image) {
        return Result<CropOutput>::Err(Status::Invalid("crop_face: invalid image"));
    }

    const int out_w = params.output_width;
    const int out_h = params.output_height();
    if (out_w <= 0 || out_h <= 0) {
        return Result<CropOutput>::Err(Status::Invalid("crop_face: non-positive output size"));
    }
    if (params.jpeg_quality < 1 || params.jpeg_quality > 100) {
        return Result<CropOutput>::Err(Status::Invalid("crop_face: jpeg_quality must be in [1,100]"));
    }

    auto rr = compute_crop_region(ImageDimensions{image.width(), image.height()}, bbox, params);
    if (!rr.ok()) return Result<CropOutput>::Err(rr.status());
    const CropRegion region = rr.value();

    auto bgr_r = internal::BgrMat::from(image);
    if (!bgr_r.ok()) return Result<CropOutput>::Err(bgr_r.status());
    const cv::Mat& src = bgr_r.value().mat();

    try {
        const double sx = static_cast<double>(out_w) / region.width;
        const double sy = static_cast<double>(out_h) / region.height;
        const cv::Matx23d M(sx, 0.0, -region.x * sx, 0.0, sy, -region.y * sy);

        cv::Mat canvas;
        cv::warpAffine(src, canvas, M, cv::Size(out_w, out_h), cv::INTER_LINEAR, cv::BORDER_REPLICATE);

        CropOutput out;
        const std::vector<int> enc = {cv::IMWRITE_JPEG_QUALITY, params.jpeg_quality};
        if (!cv::imencode(".jpg", canvas, out.jpeg, enc)) {
            return Result<CropOutput>::Err(Status::Internal("crop_face: JPEG encoding failed"));
        }

        auto px = internal::image_from_mat(std::move(canvas));
        if (!px.ok()) return Result<CropOutput>::Err(px.status());

        out.width = out_w;
        out.height = out_h;
        out.region = region;
        out.pixels = std::move(px).value();
        return Result<CropOutput>::Ok(std::move(out));

    } catch (const cv::Exception& e) {
        return Result<CropOutput>::Err(Status::Internal(std::string("crop_face: OpenCV: ") + e.what()));
    } catch (const std::bad_alloc&) {
        return Result<CropOutput>::Err(Status::OutOfMemory("crop_face: bad_alloc"));
    } catch (const std::exception& e) {
        return Result<CropOutput>::Err(Status::Internal(std::string("crop_face: ") + e.what()));
    }
}

} // namespace enroll
