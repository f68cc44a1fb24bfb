/**
 * @file validators.h
 * @brief Synchronous input checks run before and right after decoding.
 */

#pragma once

#include "config.h"
#include "export.h"
#include "scan_error.h"
#include "types.h"

namespace enroll {

/**
 * @brief Checks the declared size and media type of a raw upload.
 *
 * Size is checked first: an oversized blob is rejected as FileTooLarge whatever its type. The
 * size is the larger of the declared length and the payload size.
 * The media type must start with "image/" (ASCII case-insensitive).
 */
class ENROLL_API FileValidator final {
  public:
    explicit FileValidator(const PipelineConfig& cfg) noexcept : max_size_(cfg.max_file_size) {}

    [[nodiscard]] ScanError validate(const RawImageInput& input) const;

  private:
    std::size_t max_size_;
};

/**
 * @brief Checks width:height against the target ratio with a relative tolerance.
 */
class ENROLL_API AspectRatioValidator final {
  public:
    explicit AspectRatioValidator(const PipelineConfig& cfg) noexcept
        : target_(cfg.target_aspect_ratio), tolerance_(cfg.aspect_tolerance) {}

    [[nodiscard]] ScanError validate(const ImageDimensions& dims) const;

  private:
    double target_;
    double tolerance_;
};

} // namespace enroll
