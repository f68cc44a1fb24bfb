/**
 * @file arcface.h
 * @ingroup enroll_engine
 * @brief ArcFace-style face embedder engine.
 */

#pragma once

#include "engine/engine.h"

#include <memory>
#include <vector>

namespace enroll::engine {

/**
 * @brief Embeds a face chip into an L2-normalized vector.
 *
 * @details
 * The chip is resized to the model's square input (112 when the model declares a dynamic shape),
 * converted to RGB and normalized as (x - 127.5) / 127.5. The output is flattened and scaled to
 * unit norm.
 */
class ArcFaceEngine final : public OrtEngine {
  public:
    /** @throws std::runtime_error if the session cannot be created. */
    explicit ArcFaceEngine(const OrtModelConfig& cfg);

    [[nodiscard]] static Result<std::unique_ptr<ArcFaceEngine>> create(const OrtModelConfig& cfg) noexcept;

    Result<std::vector<float>> embed(const cv::Mat& bgr_face) noexcept;

    int input_size() const noexcept {
        return in_size_;
    }

  private:
    int in_size_ = 112;
};

} // namespace enroll::engine
