#include "scan_error.h"

#include <cstdio>
#include <sstream>
#include <string>
#include <utility>

namespace enroll {

namespace {

std::string fixed(double v, int digits) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
    return buf;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) oss << sep;
        oss << items[i];
    }
    return oss.str();
}

ScanError make(ErrorKind kind, std::string detail) {
    ScanError e;
    e.kind = kind;
    e.detail = std::move(detail);
    return e;
}

} // namespace

const char* to_string(ErrorKind k) noexcept {
    switch (k) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::FileTooLarge:
        return "FileTooLarge";
    case ErrorKind::InvalidFileType:
        return "InvalidFileType";
    case ErrorKind::AspectRatioMismatch:
        return "AspectRatioMismatch";
    case ErrorKind::NoFaceDetected:
        return "NoFaceDetected";
    case ErrorKind::MultipleFacesDetected:
        return "MultipleFacesDetected";
    case ErrorKind::FaceTooSmall:
        return "FaceTooSmall";
    case ErrorKind::LowConfidence:
        return "LowConfidence";
    case ErrorKind::PoorQuality:
        return "PoorQuality";
    case ErrorKind::ProcessingException:
        return "ProcessingException";
    }
    return "Unknown";
}

ScanError ScanError::FileTooLarge(std::size_t actual, std::size_t max) {
    ScanError e = make(ErrorKind::FileTooLarge, "size " + std::to_string(actual) + " > " + std::to_string(max));
    e.actual_bytes = actual;
    e.max_bytes = max;
    return e;
}

ScanError ScanError::InvalidFileType(std::string media_type) {
    return make(ErrorKind::InvalidFileType, "media type '" + media_type + "'");
}

ScanError ScanError::AspectRatioMismatch(double expected, double actual) {
    ScanError e = make(ErrorKind::AspectRatioMismatch, "ratio " + fixed(actual, 4) + " vs " + fixed(expected, 4));
    e.expected_ratio = expected;
    e.actual_ratio = actual;
    return e;
}

ScanError ScanError::NoFaceDetected() {
    return make(ErrorKind::NoFaceDetected, "face_count=0");
}

ScanError ScanError::MultipleFacesDetected(int face_count) {
    return make(ErrorKind::MultipleFacesDetected, "face_count=" + std::to_string(face_count));
}

ScanError ScanError::FaceTooSmall(double area) {
    return make(ErrorKind::FaceTooSmall, "face area " + fixed(area, 4));
}

ScanError ScanError::LowConfidence(double confidence) {
    return make(ErrorKind::LowConfidence, "confidence " + fixed(confidence, 4));
}

ScanError ScanError::PoorQuality(std::vector<std::string> issues) {
    ScanError e = make(ErrorKind::PoorQuality, "issues: " + join(issues, ", "));
    e.issues = std::move(issues);
    return e;
}

ScanError ScanError::ProcessingException(std::string detail) {
    return make(ErrorKind::ProcessingException, std::move(detail));
}

ScanError ScanError::from_status(const Status& s) {
    if (s.ok()) return ProcessingException("unexpected OK status");
    return ProcessingException(s.message.empty() ? std::string("unspecified failure") : s.message);
}

std::string ScanError::user_message() const {
    switch (kind) {
    case ErrorKind::None:
        return {};
    case ErrorKind::FileTooLarge: {
        const double mib = 1024.0 * 1024.0;
        return "File too large. Maximum size is " + fixed(static_cast<double>(max_bytes) / mib, 0) + "MB, got " +
               fixed(static_cast<double>(actual_bytes) / mib, 1) + "MB";
    }
    case ErrorKind::InvalidFileType:
        return "Invalid file type. Please upload an image file.";
    case ErrorKind::AspectRatioMismatch:
        return "Image aspect ratio must be 7:9 (expected " + fixed(expected_ratio, 3) + ", got " +
               fixed(actual_ratio, 3) + ").";
    case ErrorKind::NoFaceDetected:
        return "No face detected in the image. Please upload a clear photo showing your face.";
    case ErrorKind::MultipleFacesDetected:
        return "Multiple faces detected. Please upload a photo with only one face.";
    case ErrorKind::FaceTooSmall:
        return "Face too small. Please upload a photo with a larger, clearer face.";
    case ErrorKind::LowConfidence:
        return "Face detection confidence too low. Please upload a clearer photo.";
    case ErrorKind::PoorQuality: {
        const std::string list = issues.empty() ? std::string("Image quality too poor") : join(issues, ", ");
        return "Image quality issues: " + list + ". Please upload a clearer photo.";
    }
    case ErrorKind::ProcessingException:
        return "Failed to process image. Please try again.";
    }
    return "Failed to process image. Please try again.";
}

} // namespace enroll
