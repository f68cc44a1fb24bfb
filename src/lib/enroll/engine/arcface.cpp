/**
 * @file arcface.cpp
 * @ingroup enroll_engine
 * @brief ArcFace preprocessing and output normalization.
 */

#include "engine/arcface.h"

#include "embedding.h"
#include "internal/chw_preprocess.h"

#include <cmath>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace enroll::engine {

ArcFaceEngine::ArcFaceEngine(const OrtModelConfig& cfg) : OrtEngine(cfg, "enroll-arcface") {
    auto s = create_session_(cfg_.embedder_path);
    if (!s.ok()) throw std::runtime_error("ArcFace: " + s.message);

    // NCHW with a static square spatial size overrides the default.
    const auto shape = session_.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() == 4 && shape[2] > 0 && shape[2] == shape[3]) in_size_ = (int)shape[2];
}

Result<std::unique_ptr<ArcFaceEngine>> ArcFaceEngine::create(const OrtModelConfig& cfg) noexcept {
    try {
        return Result<std::unique_ptr<ArcFaceEngine>>::Ok(std::make_unique<ArcFaceEngine>(cfg));
    } catch (const std::bad_alloc&) {
        return Result<std::unique_ptr<ArcFaceEngine>>::Err(Status::OutOfMemory("ArcFace: bad_alloc"));
    } catch (const std::exception& e) {
        return Result<std::unique_ptr<ArcFaceEngine>>::Err(Status::Internal(e.what()));
    }
}

Result<std::vector<float>> ArcFaceEngine::embed(const cv::Mat& bgr_face) noexcept {
    try {
        if (bgr_face.empty() || bgr_face.type() != CV_8UC3) {
            return Result<std::vector<float>>::Err(Status::Invalid("ArcFace::embed: expected CV_8UC3 BGR"));
        }

        const float mean[3] = {127.5f, 127.5f, 127.5f};
        const float inv_std[3] = {1.0f / 127.5f, 1.0f / 127.5f, 1.0f / 127.5f};

        std::vector<float> chw((std::size_t)3 * (std::size_t)in_size_ * (std::size_t)in_size_);
        internal::bgr_u8_to_chw_f32_resize(bgr_face, in_size_, in_size_, chw.data(), mean, inv_std, true);

        auto rr = run_chw_(chw, in_size_, in_size_);
        if (!rr.ok()) return Result<std::vector<float>>::Err(rr.status());
        const auto& outs = rr.value();
        if (outs.empty()) return Result<std::vector<float>>::Err(Status::Internal("ArcFace::embed: no outputs"));

        const auto info = outs[0].GetTensorTypeAndShapeInfo();
        const std::size_t n = info.GetElementCount();
        const float* p = outs[0].GetTensorData<float>();
        if (!p || n == 0) return Result<std::vector<float>>::Err(Status::Internal("ArcFace::embed: empty output"));

        std::vector<float> v(p, p + n);
        l2_normalize(v);
        return Result<std::vector<float>>::Ok(std::move(v));
    } catch (const cv::Exception& e) {
        return Result<std::vector<float>>::Err(Status::Internal(std::string("ArcFace::embed: OpenCV: ") + e.what()));
    } catch (const std::bad_alloc&) {
        return Result<std::vector<float>>::Err(Status::OutOfMemory("ArcFace::embed: bad_alloc"));
    } catch (const std::exception& e) {
        return Result<std::vector<float>>::Err(Status::Internal(std::string("ArcFace::embed: ") + e.what()));
    }
}

} // namespace enroll::engine
