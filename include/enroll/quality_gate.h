/**
 * @file quality_gate.h
 * @brief Accept/reject decision over a detection result and its quality report.
 */

#pragma once

#include "config.h"
#include "export.h"
#include "scan_error.h"
#include "types.h"

namespace enroll {

/**
 * @brief Pure decision function; the same inputs always give the same verdict.
 *
 * Order of checks:
 *  1) no face                  -> NoFaceDetected
 *  2) more than one face       -> MultipleFacesDetected
 *  3) box outside [0,1]        -> ProcessingException
 *  4) box area < min_face_area -> FaceTooSmall
 *  5) confidence < min or NaN  -> LowConfidence; above 1 -> ProcessingException
 *  6) quality below min level  -> PoorQuality (with the report's issues)
 */
class ENROLL_API QualityGate final {
  public:
    explicit QualityGate(const PipelineConfig& cfg) noexcept
        : min_face_area_(cfg.min_face_area), min_confidence_(cfg.min_confidence), min_quality_(cfg.min_quality) {}

    [[nodiscard]] ScanError evaluate(const DetectionResult& det, const QualityReport& quality) const;

    /** @brief Same as @ref evaluate using @c det.quality. */
    [[nodiscard]] ScanError evaluate(const DetectionResult& det) const {
        return evaluate(det, det.quality);
    }

  private:
    double min_face_area_;
    double min_confidence_;
    QualityLevel min_quality_;
};

} // namespace enroll
