#include "config.h"

#include <cmath>

namespace enroll {

const char* to_string(AspectPolicy p) noexcept {
    switch (p) {
    case AspectPolicy::AutoCrop:
        return "autocrop";
    case AspectPolicy::RejectMismatch:
        return "reject";
    }
    return "unknown";
}

namespace {

Status check_intake(const PipelineConfig& c) noexcept {
    if (c.max_file_size == 0) return Status::Invalid("PipelineConfig: max_file_size must be > 0");
    if (!(std::isfinite(c.target_aspect_ratio) && c.target_aspect_ratio > 0.0))
        return Status::Invalid("PipelineConfig: target_aspect_ratio must be > 0");
    if (!(c.aspect_tolerance >= 0.0 && c.aspect_tolerance < 1.0))
        return Status::Invalid("PipelineConfig: aspect_tolerance must be in [0,1)");
    return Status::Ok();
}

Status check_gate(const PipelineConfig& c) noexcept {
    if (!(c.min_face_area >= 0.0 && c.min_face_area <= 1.0))
        return Status::Invalid("PipelineConfig: min_face_area must be in [0,1]");
    if (!(c.min_confidence >= 0.0 && c.min_confidence <= 1.0))
        return Status::Invalid("PipelineConfig: min_confidence must be in [0,1]");
    if (c.min_quality == QualityLevel::Unacceptable)
        return Status{Status::Code::Ok, "PipelineConfig: min_quality 'unacceptable' disables the quality check"};
    return Status::Ok();
}

Status check_output(const PipelineConfig& c) noexcept {
    if (!(c.padding_ratio >= 0.0 && c.padding_ratio <= 1.0))
        return Status::Invalid("PipelineConfig: padding_ratio must be in [0,1]");
    if (c.output_width <= 0) return Status::Invalid("PipelineConfig: output_width must be > 0");
    if (c.output_height() <= 0) return Status::Invalid("PipelineConfig: output height rounds to 0");
    if (c.jpeg_quality < 1 || c.jpeg_quality > 100)
        return Status::Invalid("PipelineConfig: jpeg_quality must be in [1,100]");
    if (c.embedding_dim <= 0) return Status::Invalid("PipelineConfig: embedding_dim must be > 0");
    return Status::Ok();
}

} // namespace

Status PipelineConfig::validate() const noexcept {
    Status st = Status::Ok();
    ENROLL_STATUS_TRY(st, check_intake(*this));
    ENROLL_STATUS_TRY(st, check_gate(*this));
    ENROLL_STATUS_TRY(st, check_output(*this));
    return st;
}

int PipelineConfig::output_height() const noexcept {
    if (!(target_aspect_ratio > 0.0)) return 0;
    return static_cast<int>(std::lround(static_cast<double>(output_width) / target_aspect_ratio));
}

} // namespace enroll
