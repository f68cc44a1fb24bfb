/**
 * @file config.h
 * @brief Pipeline configuration: acceptance constants, aspect policy and verbosity.
 *
 * Defaults are the fixed enrollment constants. Values are never read from the environment.
 */

#pragma once

#include "export.h"
#include "status.h"
#include "types.h"

#include <cstddef>
#include <cstdint>

namespace enroll {

/**
 * @brief What to do with decoded images whose ratio is outside the 7:9 tolerance.
 */
enum class AspectPolicy : std::uint8_t {
    /** Log the mismatch and continue; the detected box drives the crop to the target ratio. */
    AutoCrop = 0,
    /** Reject with AspectRatioMismatch before detection. */
    RejectMismatch = 1,
};

[[nodiscard]] ENROLL_API const char* to_string(AspectPolicy p) noexcept;

inline constexpr std::size_t kMaxFileSize = 5u * 1024u * 1024u;
inline constexpr double kTargetAspectRatio = 7.0 / 9.0;
inline constexpr double kAspectTolerance = 0.10;
inline constexpr double kPaddingRatio = 0.20;
inline constexpr double kMinFaceArea = 0.08;
inline constexpr double kMinConfidence = 0.80;
inline constexpr int kOutputWidth = 400;
inline constexpr int kJpegQuality = 95;
inline constexpr int kEmbeddingDim = 128;

struct ENROLL_API PipelineConfig final {
    std::size_t max_file_size = kMaxFileSize;

    double target_aspect_ratio = kTargetAspectRatio;

    /** @brief Relative tolerance: accept iff |ratio - target| <= tolerance * target. */
    double aspect_tolerance = kAspectTolerance;

    AspectPolicy aspect_policy = AspectPolicy::AutoCrop;

    double padding_ratio = kPaddingRatio;
    double min_face_area = kMinFaceArea;
    double min_confidence = kMinConfidence;

    /** @brief Lowest accepted quality level. */
    QualityLevel min_quality = QualityLevel::Good;

    int output_width = kOutputWidth;
    int jpeg_quality = kJpegQuality;

    /** @brief Expected embedding length; embeddings of any other length are rejected. */
    int embedding_dim = kEmbeddingDim;

    bool verbose = false;

    /**
     * @brief Range checks; returns the first violation found.
     *
     * An OK result may carry a "warning: " message, e.g. when @ref min_quality is Unacceptable.
     */
    [[nodiscard]] Status validate() const noexcept;

    /** @brief Output canvas height: round(output_width / target_aspect_ratio). */
    [[nodiscard]] int output_height() const noexcept;
};

} // namespace enroll
