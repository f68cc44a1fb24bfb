/**
 * @file scan_error.h
 * @brief Typed rejection reasons of the intake pipeline.
 *
 * A @ref enroll::ScanError is a verdict, not a fault: validators and the quality gate return one
 * (OK meaning "accepted"), and the orchestrator turns a non-OK one into the Error state and a
 * single user-facing message. Faults of collaborators arrive as @ref enroll::Status and are mapped
 * to @ref enroll::ErrorKind::ProcessingException by @ref enroll::ScanError::from_status.
 */

#pragma once

#include "export.h"
#include "status.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace enroll {

enum class ErrorKind : std::uint8_t {
    None = 0,
    FileTooLarge,
    InvalidFileType,
    AspectRatioMismatch,
    NoFaceDetected,
    MultipleFacesDetected,
    FaceTooSmall,
    LowConfidence,
    PoorQuality,
    ProcessingException,
};

[[nodiscard]] ENROLL_API const char* to_string(ErrorKind k) noexcept;

struct ENROLL_API ScanError final {
    ErrorKind kind = ErrorKind::None;

    /** @brief Internal diagnostic (never shown to the user as-is). */
    std::string detail{};

    // FileTooLarge
    std::size_t actual_bytes = 0;
    std::size_t max_bytes = 0;

    // AspectRatioMismatch
    double expected_ratio = 0.0;
    double actual_ratio = 0.0;

    // PoorQuality
    std::vector<std::string> issues{};

    [[nodiscard]] bool ok() const noexcept {
        return kind == ErrorKind::None;
    }

    static ScanError Ok() {
        return {};
    }

    static ScanError FileTooLarge(std::size_t actual, std::size_t max);
    static ScanError InvalidFileType(std::string media_type);
    static ScanError AspectRatioMismatch(double expected, double actual);
    static ScanError NoFaceDetected();
    static ScanError MultipleFacesDetected(int face_count);
    static ScanError FaceTooSmall(double area);
    static ScanError LowConfidence(double confidence);
    static ScanError PoorQuality(std::vector<std::string> issues);
    static ScanError ProcessingException(std::string detail);

    /** @brief Maps a collaborator/plumbing failure to ProcessingException, keeping its message. */
    static ScanError from_status(const Status& s);

    /**
     * @brief The one message shown to the user for this error.
     *
     * Derived only from the kind and its payload, so equal errors produce equal messages.
     */
    [[nodiscard]] std::string user_message() const;
};

} // namespace enroll
