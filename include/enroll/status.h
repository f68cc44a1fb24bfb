/**
 * @file status.h
 * @brief Status and result types used for plumbing-level error propagation in enroll.
 *
 * - @ref enroll::Status carries a compact code plus a diagnostic message.
 * - @ref enroll::Result holds either a value or a non-OK status.
 *
 * Decoding, crop rendering, model sessions and collaborator calls report through these types and
 * never throw across the library boundary. Domain verdicts of the intake pipeline (file too large,
 * multiple faces, ...) use @ref enroll::ScanError instead, see scan_error.h.
 *
 * @ingroup enroll_status
 */

/**
 * @defgroup enroll_status Status and Result
 * @brief Error handling primitives used across the enroll API.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

/**
 * @def ENROLL_STATUS_TRY
 * @brief Evaluate an expression returning ::enroll::Status and return it from the caller on error.
 *
 * An OK status with a non-empty message is a warning; it is copied into @p stat.message with a
 * @c "warning: " prefix (the last warning wins).
 *
 * @code
 * ::enroll::Status f() {
 *   ::enroll::Status st = ::enroll::Status::Ok();
 *   ENROLL_STATUS_TRY(st, step1());
 *   ENROLL_STATUS_TRY(st, step2());
 *   return st;
 * }
 * @endcode
 */
#ifndef ENROLL_STATUS_TRY
    #define ENROLL_STATUS_TRY(stat, expr)                                                                              \
        do {                                                                                                           \
            ::enroll::Status _enroll_st = (expr);                                                                      \
            if (!_enroll_st.ok()) return _enroll_st;                                                                   \
            if (!_enroll_st.message.empty()) stat.message = std::string("warning: ") + _enroll_st.message;             \
        } while (0)
#endif

namespace enroll {

/**
 * @ingroup enroll_status
 * @brief Outcome of an operation: success or a typed error with a message.
 *
 * Non-OK codes should carry an actionable message that names the failing function.
 */
struct Status final {
    /**
     * @brief Canonical error codes. Numeric values are part of the contract; do not renumber.
     */
    enum class Code : std::uint8_t {
        /** Operation completed successfully. */
        Ok = 0,
        /** Invalid input argument or precondition violation. */
        InvalidArgument = 1,
        /** Requested resource was not found (file, model, ...). */
        NotFound = 2,
        /** Operation or configuration is not supported by this build/runtime. */
        Unsupported = 3,
        /** Input data could not be decoded (image bytes, tensor shapes). */
        DecodeError = 4,
        /** Unexpected state or third-party library failure. */
        Internal = 5,
        /** Memory allocation failed. */
        OutOfMemory = 6,
    };

    Code code = Code::Ok;

    /** @brief Diagnostic message (may be empty for @ref Code::Ok). */
    std::string message{};

    static Status Ok() {
        return {Code::Ok, {}};
    }

    static Status Invalid(std::string msg) {
        return {Code::InvalidArgument, std::move(msg)};
    }

    static Status NotFound(std::string msg) {
        return {Code::NotFound, std::move(msg)};
    }

    static Status Unsupported(std::string msg) {
        return {Code::Unsupported, std::move(msg)};
    }

    static Status DecodeError(std::string msg) {
        return {Code::DecodeError, std::move(msg)};
    }

    static Status Internal(std::string msg) {
        return {Code::Internal, std::move(msg)};
    }

    static Status OutOfMemory(std::string msg) {
        return {Code::OutOfMemory, std::move(msg)};
    }

    /** @brief True if @ref code is @ref Code::Ok. */
    bool ok() const noexcept {
        return code == Code::Ok;
    }
};

/**
 * @ingroup enroll_status
 * @brief Holds either a value of type @c T or an error @ref Status.
 *
 * @code
 * enroll::Result<enroll::Image> r = enroll::decode_image(bytes, enroll::PixelFormat::BGR_U8);
 * if (!r.ok()) {
 *   std::cerr << r.status().message << "\n";
 *   return;
 * }
 * enroll::Image img = std::move(r).value();
 * @endcode
 *
 * @warning
 * @ref value() is unchecked. Calling it when @ref ok() is false is undefined behavior.
 *
 * @tparam T Value type stored on success.
 */
template <class T> class Result final {
  public:
    static Result Ok(T v) {
        Result r;
        r.value_.emplace(std::move(v));
        r.status_ = Status::Ok();
        return r;
    }

    /** @note @p s must be non-OK, otherwise @ref ok() reports success with no value present. */
    static Result Err(Status s) {
        Result r;
        r.status_ = std::move(s);
        return r;
    }

    bool ok() const noexcept {
        return status_.ok();
    }

    const Status& status() const noexcept {
        return status_;
    }

    T& value() & {
        return *value_;
    }

    const T& value() const& {
        return *value_;
    }

    T&& value() && {
        return std::move(*value_);
    }

  private:
    Result() = default;

    std::optional<T> value_;

    Status status_{};
};

} // namespace enroll
