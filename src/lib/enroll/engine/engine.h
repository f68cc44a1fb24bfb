/**
 * @file engine.h
 * @ingroup enroll_engine
 * @brief Shared ONNX Runtime plumbing for the detector and embedder engines.
 *
 * @details
 * @ref enroll::engine::OrtEngine owns one ORT session and the resolved I/O names. Concrete engines
 * add model-specific preprocessing and output decoding on top of it.
 *
 * @note
 * Internal header (under `src/lib/enroll/engine`), compiled into the @c enroll_ort library only.
 */

#pragma once

#include "internal/opencv_headers.h" // IWYU pragma: keep
#include "internal/ort_headers.h"    // IWYU pragma: keep
#include "ort_client.h"
#include "status.h"

#include <string>
#include <vector>

namespace enroll::engine {

/**
 * @brief Base of the ORT-backed engines.
 *
 * @par Thread-safety
 * Inference calls run on the event loop thread; instances are not shared across threads.
 */
class OrtEngine {
  public:
    virtual ~OrtEngine() noexcept = default;

    OrtEngine(const OrtEngine&) = delete;
    OrtEngine& operator=(const OrtEngine&) = delete;

    const OrtModelConfig& config() const noexcept {
        return cfg_;
    }

    const std::string& input_name() const noexcept {
        return in_name_;
    }

    const std::vector<std::string>& output_names() const noexcept {
        return out_names_;
    }

  protected:
    OrtEngine(const OrtModelConfig& cfg, const char* log_id);

    /**
     * @brief Process-wide ORT environment, created on first use with ERROR log level.
     *
     * @warning Only the first @p log_id is used; later calls reuse the existing environment.
     */
    static Ort::Env& global_env_(const char* log_id) {
        static Ort::Env env(ORT_LOGGING_LEVEL_ERROR, (log_id && log_id[0]) ? log_id : "enroll");
        return env;
    }

    /**
     * @brief Configures @ref so_ and loads @p model_path into @ref session_, then resolves I/O names.
     *
     * Exceptions are converted to @ref Status.
     */
    Status create_session_(const std::string& model_path) noexcept;

    /** @brief Runs the session on a single NCHW float tensor and returns all outputs. */
    Result<std::vector<Ort::Value>> run_chw_(std::vector<float>& chw, int in_w, int in_h) noexcept;

    void log_(const std::string& msg) const;

  protected:
    OrtModelConfig cfg_;

    Ort::Env& env_;
    Ort::SessionOptions so_;
    Ort::Session session_{nullptr};
    Ort::AllocatorWithDefaultOptions alloc_;

    std::string in_name_;
    std::vector<std::string> out_names_;

  private:
    void init_io_names_();
};

} // namespace enroll::engine
