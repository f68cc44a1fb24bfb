/**
 * @file face_cropper.h
 * @brief Detection-driven crop: pad the face box, correct it to the target ratio, render a fixed
 * size canvas and re-encode it as JPEG.
 *
 * The geometry step (@ref enroll::compute_crop_region) is a pure function of the image
 * dimensions, so it can be tested without pixels. @ref enroll::crop_face adds rendering and
 * encoding; given identical inputs it produces identical bytes.
 */

#pragma once

#include "config.h"
#include "export.h"
#include "image.h"
#include "status.h"
#include "types.h"

#include <cstdint>
#include <vector>

namespace enroll {

struct CropParams {
    double padding_ratio = kPaddingRatio;
    double target_aspect_ratio = kTargetAspectRatio;
    int output_width = kOutputWidth;
    int jpeg_quality = kJpegQuality;

    [[nodiscard]] static CropParams from(const PipelineConfig& cfg) noexcept {
        CropParams p;
        p.padding_ratio = cfg.padding_ratio;
        p.target_aspect_ratio = cfg.target_aspect_ratio;
        p.output_width = cfg.output_width;
        p.jpeg_quality = cfg.jpeg_quality;
        return p;
    }

    /** @brief round(output_width / target_aspect_ratio). */
    [[nodiscard]] int output_height() const noexcept;
};

/** @brief Everything produced by one crop. */
struct CropOutput {
    /** @brief JPEG bytes of the @ref width x @ref height canvas. */
    std::vector<std::uint8_t> jpeg{};
    int width = 0;
    int height = 0;
    CropRegion region{};
    /** @brief Rendered canvas (BGR_U8, owning); fed to the re-embed step. */
    Image pixels{};
};

/**
 * @brief Computes the padded, ratio-corrected crop rectangle for @p bbox on an image of @p dims.
 *
 * @retval Status::Invalid for non-positive dimensions, a malformed box, or a region smaller
 *         than one pixel.
 */
[[nodiscard]] ENROLL_API Result<CropRegion> compute_crop_region(const ImageDimensions& dims, const BoundingBox& bbox,
                                                                const CropParams& params) noexcept;

/**
 * @brief Renders the crop region of @p image into the output canvas and encodes it.
 *
 * The region is scaled to fill the canvas exactly (bilinear, edge pixels replicated at the
 * border). Any 3 or 4 channel @ref PixelFormat is accepted.
 */
[[nodiscard]] ENROLL_API Result<CropOutput> crop_face(const Image& image, const BoundingBox& bbox,
                                                      const CropParams& params) noexcept;

} // namespace enroll
