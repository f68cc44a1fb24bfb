/**
 * @file ort_client.h
 * @brief ONNX Runtime implementation of @ref enroll::DetectionClient (SCRFD detector + ArcFace embedder).
 *
 * Built as the separate @c enroll_ort library so that the pipeline core does not depend on
 * ONNX Runtime.
 */

#pragma once

#include "detection_client.h"
#include "event_loop.h"
#include "export.h"
#include "status.h"

#include <memory>
#include <string>

namespace enroll {

struct ENROLL_API OrtModelConfig final {
    /** @brief SCRFD face detector (.onnx). */
    std::string detector_path{};

    /** @brief ArcFace-style embedder with a 112x112 input (.onnx). */
    std::string embedder_path{};

    int ort_intra_threads = 1;
    int ort_inter_threads = 1;

    /** @brief Minimum face score kept by the detector decode. */
    float score_thresh = 0.5f;

    /** @brief IoU threshold of the greedy box NMS. */
    float nms_iou = 0.4f;

    /** @brief Longest input side fed to the detector (the image is downscaled, never upscaled). */
    int max_img_size = 640;

    /** @brief Minimum face side in source pixels. */
    int min_face_px = 10;

    /** @brief Apply a sigmoid to score outputs exported as logits. */
    bool apply_sigmoid = false;

    bool verbose = false;

    [[nodiscard]] Status validate() const noexcept;
};

/**
 * @brief Loads both models and returns a client whose completions are posted to @p loop.
 *
 * @p loop must outlive the client.
 */
[[nodiscard]] ENROLL_API Result<std::unique_ptr<DetectionClient>>
create_ort_detection_client(const OrtModelConfig& cfg, EventLoop& loop) noexcept;

} // namespace enroll
