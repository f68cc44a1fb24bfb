#include "types.h"

#include <cmath>
#include <utility>

namespace enroll {

namespace {

// Slack for boxes that touch the right/bottom edge after float round-off.
constexpr double kUnitEps = 1e-6;

} // namespace

RawImageInput RawImageInput::from_bytes(std::vector<std::uint8_t> bytes, std::string media_type) {
    RawImageInput in;
    in.byte_length = bytes.size();
    in.media_type = std::move(media_type);
    in.payload = std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes));
    return in;
}

bool BoundingBox::is_valid() const noexcept {
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(width) || !std::isfinite(height)) return false;
    if (x < 0.0 || y < 0.0 || width <= 0.0 || height <= 0.0) return false;
    return x + width <= 1.0 + kUnitEps && y + height <= 1.0 + kUnitEps;
}

const char* to_string(QualityLevel q) noexcept {
    switch (q) {
    case QualityLevel::Unacceptable:
        return "unacceptable";
    case QualityLevel::Poor:
        return "poor";
    case QualityLevel::Fair:
        return "fair";
    case QualityLevel::Good:
        return "good";
    case QualityLevel::Excellent:
        return "excellent";
    }
    return "unknown";
}

const char* to_string(ScanStage s) noexcept {
    switch (s) {
    case ScanStage::Idle:
        return "idle";
    case ScanStage::Validating:
        return "validating";
    case ScanStage::Detecting:
        return "detecting";
    case ScanStage::QualityChecking:
        return "quality_checking";
    case ScanStage::Cropping:
        return "cropping";
    case ScanStage::ReEmbedding:
        return "re_embedding";
    case ScanStage::Complete:
        return "complete";
    case ScanStage::Error:
        return "error";
    }
    return "unknown";
}

} // namespace enroll
