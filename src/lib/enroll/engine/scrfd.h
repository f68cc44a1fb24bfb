/**
 * @file scrfd.h
 * @ingroup enroll_engine
 * @brief SCRFD face detector engine.
 *
 * @details
 * SCRFD exports differ in how they lay out the per-stride score and bbox tensors. The engine
 * resolves the heads (strides 8/16/32) from the output names and shapes of the first run and
 * decodes distance-to-edge boxes into source-pixel @ref enroll::algo::Detection values.
 */

#pragma once

#include "algo/geometry.h"
#include "engine/engine.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace enroll::engine {

class ScrfdEngine final : public OrtEngine {
  public:
    /** @throws std::runtime_error if the config is invalid or the session cannot be created. */
    explicit ScrfdEngine(const OrtModelConfig& cfg);

    [[nodiscard]] static Result<std::unique_ptr<ScrfdEngine>> create(const OrtModelConfig& cfg) noexcept;

    /**
     * @brief Detects faces in @p bgr (CV_8UC3).
     * @return Candidates above the score threshold, sorted by descending score, before NMS.
     */
    Result<std::vector<algo::Detection>> infer(const cv::Mat& bgr) noexcept;

  private:
    enum class Layout : std::uint8_t {
        Unknown = 0,
        Score_CHW,  ///< [1,C,H,W]
        Score_Flat, ///< [1,N,C] with N = H*W*anchors
        Score_HW,   ///< [1,H,W] or [H,W]
        BBox_CHW,   ///< [1,4,H,W]
        BBox_Flat,  ///< [1,N,4]
        BBox_HW4    ///< [1,H,W,4]
    };

    struct Head {
        int stride = 0;
        int score_idx = -1;
        int bbox_idx = -1;

        Layout score_layout = Layout::Unknown;
        Layout bbox_layout = Layout::Unknown;

        int Hs = 0;
        int Ws = 0;
        int anchors = 1;
        int score_ch = 1;
    };

    Status resolve_heads_(const std::vector<Ort::Value>& outs, int in_w, int in_h, std::vector<Head>* heads) const;

    std::vector<algo::Detection> decode_(const std::vector<Head>& heads, const std::vector<Ort::Value>& outs, float sx,
                                         float sy, int orig_w, int orig_h) const;

    std::vector<Head> heads_;
    int heads_w_ = 0;
    int heads_h_ = 0;
};

} // namespace enroll::engine
