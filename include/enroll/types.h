/**
 * @file types.h
 * @brief Value types shared by the intake pipeline: inputs, detections, quality, crops, scan state.
 *
 * Geometry conventions:
 * - @ref enroll::BoundingBox is normalized to [0,1] relative to the image it was detected on.
 * - @ref enroll::CropRegion is expressed in source pixels.
 *
 * @defgroup enroll_types Pipeline types
 * @{
 */

#pragma once

#include "export.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace enroll {

/**
 * @brief Raw blob handed over by the host (file picker, drag-drop, CLI).
 *
 * The payload is shared and immutable so that async stages can hold it without copying.
 * @ref byte_length is the declared size and is what the file validator checks, before any decode.
 */
struct RawImageInput {
    std::size_t byte_length = 0;
    std::string media_type{};
    std::shared_ptr<const std::vector<std::uint8_t>> payload{};

    /** @brief Builds an input whose declared length matches @p bytes. */
    [[nodiscard]] static RawImageInput from_bytes(std::vector<std::uint8_t> bytes, std::string media_type);
};

/** @brief Decoded pixel dimensions. */
struct ImageDimensions {
    int width = 0;
    int height = 0;
};

/** @brief Face box normalized to [0,1]; `x + width <= 1`, `y + height <= 1`. */
struct BoundingBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    [[nodiscard]] constexpr double area() const noexcept {
        return width * height;
    }

    /** @brief True when all components are finite, non-negative and inside the unit square. */
    [[nodiscard]] bool is_valid() const noexcept;
};

/**
 * @brief Ordered quality scale. Comparison operators follow the declaration order.
 */
enum class QualityLevel : std::uint8_t {
    Unacceptable = 0,
    Poor = 1,
    Fair = 2,
    Good = 3,
    Excellent = 4,
};

[[nodiscard]] ENROLL_API const char* to_string(QualityLevel q) noexcept;

/** @brief Coarse verdict plus ordered defect tags ("Low contrast", "Image blurry", ...). */
struct QualityReport {
    QualityLevel overall = QualityLevel::Unacceptable;
    std::vector<std::string> issues{};
};

/**
 * @brief Output of @ref enroll::DetectionClient::detect.
 *
 * @ref bbox is present iff @ref face_count >= 1; @ref confidence is present iff a primary face
 * was found. @ref quality describes the primary face region (or the whole image without one).
 */
struct DetectionResult {
    int face_count = 0;
    std::optional<BoundingBox> bbox{};
    std::optional<double> confidence{};
    QualityReport quality{};
};

/** @brief Output of @ref enroll::DetectionClient::embed. */
struct EmbedResult {
    std::vector<float> embedding{};
    QualityReport quality{};
};

/** @brief Aspect-corrected crop rectangle in source pixels (fractional). */
struct CropRegion {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    [[nodiscard]] double ratio() const noexcept {
        return height > 0.0 ? width / height : 0.0;
    }
};

/** @brief Pipeline stages; @ref Complete and @ref Error are terminal for a generation. */
enum class ScanStage : std::uint8_t {
    Idle = 0,
    Validating,
    Detecting,
    QualityChecking,
    Cropping,
    ReEmbedding,
    Complete,
    Error,
};

[[nodiscard]] ENROLL_API const char* to_string(ScanStage s) noexcept;

/** @brief Progress gauges in percent, each in [0, 100]. */
struct ScanProgress {
    int detection = 0;
    int embedding = 0;
    int quality = 0;
    int overall = 0;
};

/** @brief Final product of a successful generation. */
struct ScanResult {
    std::vector<float> embedding{};
    std::vector<std::uint8_t> crop_jpeg{};
    int crop_width = 0;
    int crop_height = 0;
    BoundingBox bbox{};
    CropRegion region{};
    QualityReport crop_quality{};
};

} // namespace enroll

/** @} */
