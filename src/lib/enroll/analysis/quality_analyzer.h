/**
 * @file quality_analyzer.h
 * @brief Photometric and geometric quality measurements of a face photo.
 */

#pragma once

#include "internal/opencv_headers.h" // IWYU pragma: keep
#include "status.h"
#include "types.h"

namespace enroll::analysis {

/**
 * @brief Raw measurements, each normalized to [0, 1] except @ref face_resolution.
 */
struct QualityMetrics {
    double brightness = 0.0;      ///< mean gray / 255
    double contrast = 0.0;        ///< stddev(gray) / 64, capped at 1
    double sharpness = 0.0;       ///< share of strong Sobel edges relative to 10% of the region, capped at 1
    double face_size = 0.0;       ///< face box area / image area
    double face_resolution = 0.0; ///< min(face width, face height) in pixels
};

struct QualityAnalysis {
    QualityMetrics metrics{};
    QualityReport report{};
};

/**
 * @brief Turns metrics into a graded report.
 *
 * Issues are listed in a fixed order. The level is the number of satisfied criteria:
 * 5 excellent, 4 good, 3 fair, 2 poor, fewer unacceptable.
 */
[[nodiscard]] QualityReport grade_quality(const QualityMetrics& m);

/**
 * @brief Measures @p bgr inside @p face (whole image if @p face is empty) and grades it.
 *
 * @param bgr  Image, CV_8UC3 BGR.
 * @param face Face rectangle in pixels; clamped to the image.
 */
[[nodiscard]] Result<QualityAnalysis> analyze_quality(const cv::Mat& bgr, const cv::Rect& face) noexcept;

} // namespace enroll::analysis
