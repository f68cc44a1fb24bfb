#include "quality_gate.h"

namespace enroll {

ScanError QualityGate::evaluate(const DetectionResult& det, const QualityReport& quality) const {
    if (det.face_count <= 0) {
        return ScanError::NoFaceDetected();
    }
    if (det.face_count > 1) {
        return ScanError::MultipleFacesDetected(det.face_count);
    }
    // A single face without a box cannot be cropped.
    if (!det.bbox) {
        return ScanError::NoFaceDetected();
    }

    if (!det.bbox->is_valid()) {
        return ScanError::ProcessingException("bounding box outside the unit square");
    }

    // Negated comparisons so that NaN fails the check.
    const double area = det.bbox->area();
    if (!(area >= min_face_area_)) {
        return ScanError::FaceTooSmall(area);
    }

    const double conf = det.confidence.value_or(0.0);
    if (!(conf >= min_confidence_)) {
        return ScanError::LowConfidence(conf);
    }
    if (conf > 1.0) {
        return ScanError::ProcessingException("confidence above 1");
    }

    if (quality.overall < min_quality_) {
        return ScanError::PoorQuality(quality.issues);
    }

    return ScanError::Ok();
}

} // namespace enroll
