/**
 * @file scrfd.cpp
 * @ingroup enroll_engine
 * @brief SCRFD preprocessing, head resolution and decoding.
 *
 * @details
 * Input is resized so that its longer side does not exceed @ref enroll::OrtModelConfig::max_img_size
 * and aligned up to a multiple of 32, then normalized as (x - 127.5) / 128 in BGR order.
 */

#include "engine/scrfd.h"

#include "internal/chw_preprocess.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace enroll::engine {

namespace {

inline int align_up_(int v, int a) noexcept {
    if (a <= 1) return v;
    return (v + a - 1) / a * a;
}

inline float sigmoid_(float x) noexcept {
    return 1.0f / (1.0f + std::exp(-x));
}

} // namespace

ScrfdEngine::ScrfdEngine(const OrtModelConfig& cfg) : OrtEngine(cfg, "enroll-scrfd") {
    const Status vs = cfg_.validate();
    if (!vs.ok()) throw std::runtime_error(vs.message);

    auto s = create_session_(cfg_.detector_path);
    if (!s.ok()) throw std::runtime_error("SCRFD: " + s.message);
}

Result<std::unique_ptr<ScrfdEngine>> ScrfdEngine::create(const OrtModelConfig& cfg) noexcept {
    try {
        return Result<std::unique_ptr<ScrfdEngine>>::Ok(std::make_unique<ScrfdEngine>(cfg));
    } catch (const std::bad_alloc&) {
        return Result<std::unique_ptr<ScrfdEngine>>::Err(Status::OutOfMemory("SCRFD: bad_alloc"));
    } catch (const std::exception& e) {
        return Result<std::unique_ptr<ScrfdEngine>>::Err(Status::Internal(e.what()));
    }
}

/**
 * @details
 * Outputs are matched to strides by name tokens ("score"/"cls"/"conf" and "bbox"/"reg" plus the
 * stride number). Exports without such names fall back to the conventional ordering
 * (score8, score16, score32, bbox8, bbox16, bbox32). Heads whose layout cannot be recognised
 * are skipped.
 */
Status ScrfdEngine::resolve_heads_(const std::vector<Ort::Value>& outs, int in_w, int in_h,
                                   std::vector<Head>* heads) const {
    auto find_by = [&](const char* what, const std::string& stride) -> int {
        for (int i = 0; i < (int)out_names_.size(); ++i) {
            const auto& n = out_names_[(std::size_t)i];
            if (n.find(what) != std::string::npos && n.find(stride) != std::string::npos) return i;
        }
        return -1;
    };

    std::vector<Head> hs;
    hs.reserve(3);

    for (int stride : {8, 16, 32}) {
        Head h;
        h.stride = stride;
        const std::string s = std::to_string(stride);

        int si = find_by("score", s);
        if (si < 0) si = find_by("cls", s);
        if (si < 0) si = find_by("conf", s);
        int bi = find_by("bbox", s);
        if (bi < 0) bi = find_by("reg", s);

        if (si < 0 || bi < 0) {
            if (outs.size() < 6) continue;
            si = stride == 8 ? 0 : (stride == 16 ? 1 : 2);
            bi = stride == 8 ? 3 : (stride == 16 ? 4 : 5);
        }
        h.score_idx = si;
        h.bbox_idx = bi;

        const auto sshape = outs[(std::size_t)si].GetTensorTypeAndShapeInfo().GetShape();
        const auto bshape = outs[(std::size_t)bi].GetTensorTypeAndShapeInfo().GetShape();

        h.Hs = std::max(1, in_h / stride);
        h.Ws = std::max(1, in_w / stride);

        if (sshape.size() == 4 && sshape[1] > 0 && sshape[1] <= 8) {
            h.score_layout = Layout::Score_CHW;
            h.score_ch = (int)sshape[1];
            h.Hs = (int)sshape[2];
            h.Ws = (int)sshape[3];
        } else if (sshape.size() == 3 && sshape[0] == 1 && sshape[2] > 0 && sshape[2] <= 8) {
            h.score_layout = Layout::Score_Flat;
            h.score_ch = (int)sshape[2];
        } else if (sshape.size() == 2 && sshape[1] > 0 && sshape[1] <= 8) {
            // [N,C] exports without a batch axis
            h.score_layout = Layout::Score_Flat;
            h.score_ch = (int)sshape[1];
        } else if (sshape.size() == 3) {
            h.score_layout = Layout::Score_HW;
            h.Hs = (int)sshape[1];
            h.Ws = (int)sshape[2];
        }

        if (bshape.size() == 4 && bshape[1] == 4) {
            h.bbox_layout = Layout::BBox_CHW;
        } else if ((bshape.size() == 3 && bshape[2] == 4) || (bshape.size() == 2 && bshape[1] == 4)) {
            h.bbox_layout = Layout::BBox_Flat;
        } else if (bshape.size() == 4 && bshape[3] == 4) {
            h.bbox_layout = Layout::BBox_HW4;
        }

        if (h.score_layout == Layout::Score_Flat) {
            const int64_t nloc = sshape[sshape.size() - 2];
            const int hw = std::max(1, h.Hs * h.Ws);
            if (nloc % hw == 0) h.anchors = (int)(nloc / hw);
        }

        if (h.score_layout == Layout::Unknown || h.bbox_layout == Layout::Unknown) continue;
        hs.push_back(h);
    }

    if (hs.empty()) return Status::Unsupported("SCRFD: cannot resolve output heads");
    *heads = std::move(hs);
    return Status::Ok();
}

std::vector<algo::Detection> ScrfdEngine::decode_(const std::vector<Head>& heads, const std::vector<Ort::Value>& outs,
                                                  float sx, float sy, int orig_w, int orig_h) const {
    std::vector<algo::Detection> dets;
    dets.reserve(64);

    const float thr = cfg_.score_thresh;
    const float min_side = (float)std::max(0, cfg_.min_face_px);

    for (const Head& h : heads) {
        const float* score = outs[(std::size_t)h.score_idx].GetTensorData<float>();
        const float* bbox = outs[(std::size_t)h.bbox_idx].GetTensorData<float>();
        if (!score || !bbox) continue;

        const int Hs = std::max(1, h.Hs);
        const int Ws = std::max(1, h.Ws);
        const int A = std::max(1, h.anchors);
        const int hw = Hs * Ws;
        const float stride = (float)h.stride;

        // Two-channel score heads carry (background, face).
        const int ch = h.score_ch > 1 ? 1 : 0;

        for (int y = 0; y < Hs; ++y) {
            for (int x = 0; x < Ws; ++x) {
                for (int a = 0; a < A; ++a) {
                    const int cell = y * Ws + x;
                    const int loc = cell * A + a;

                    float sc = 0.0f;
                    if (h.score_layout == Layout::Score_CHW)
                        sc = score[ch * hw + cell];
                    else if (h.score_layout == Layout::Score_Flat)
                        sc = score[loc * h.score_ch + ch];
                    else
                        sc = score[cell];

                    if (cfg_.apply_sigmoid) sc = sigmoid_(sc);
                    if (sc < thr) continue;

                    float d[4];
                    if (h.bbox_layout == Layout::BBox_CHW) {
                        for (int k = 0; k < 4; ++k)
                            d[k] = bbox[k * hw + cell] * stride;
                    } else if (h.bbox_layout == Layout::BBox_Flat) {
                        for (int k = 0; k < 4; ++k)
                            d[k] = bbox[loc * 4 + k] * stride;
                    } else {
                        for (int k = 0; k < 4; ++k)
                            d[k] = bbox[cell * 4 + k] * stride;
                    }

                    const float cx = (float)x * stride;
                    const float cy = (float)y * stride;

                    const cv::Rect2f raw((cx - d[0]) / sx, (cy - d[1]) / sy, (d[0] + d[2]) / sx, (d[1] + d[3]) / sy);
                    const cv::Rect2f box = algo::clamp_box(raw, orig_w, orig_h);

                    if (box.width <= 0.0f || box.height <= 0.0f) continue;
                    if (box.width < min_side || box.height < min_side) continue;

                    dets.push_back(algo::Detection{box, sc});
                }
            }
        }
    }

    std::sort(dets.begin(), dets.end(), [](const auto& a, const auto& b) { return a.score > b.score; });
    return dets;
}

Result<std::vector<algo::Detection>> ScrfdEngine::infer(const cv::Mat& bgr) noexcept {
    try {
        if (bgr.empty() || bgr.type() != CV_8UC3) {
            return Result<std::vector<algo::Detection>>::Err(Status::Invalid("SCRFD::infer: expected CV_8UC3 BGR"));
        }

        const int ow = bgr.cols;
        const int oh = bgr.rows;

        int tw = ow;
        int th = oh;
        const int max_side = std::max(ow, oh);
        if (cfg_.max_img_size > 0 && max_side > cfg_.max_img_size) {
            const float scale = (float)cfg_.max_img_size / (float)max_side;
            tw = std::max(1, (int)std::lround(ow * scale));
            th = std::max(1, (int)std::lround(oh * scale));
        }
        tw = align_up_(tw, 32);
        th = align_up_(th, 32);

        const float sx = (float)tw / (float)ow;
        const float sy = (float)th / (float)oh;

        std::vector<float> chw((std::size_t)3 * (std::size_t)th * (std::size_t)tw);
        const float mean[3] = {127.5f, 127.5f, 127.5f};
        const float inv_std[3] = {1.0f / 128.0f, 1.0f / 128.0f, 1.0f / 128.0f};
        internal::bgr_u8_to_chw_f32_resize(bgr, tw, th, chw.data(), mean, inv_std);

        auto rr = run_chw_(chw, tw, th);
        if (!rr.ok()) return Result<std::vector<algo::Detection>>::Err(rr.status());
        const auto& outs = rr.value();
        if (outs.size() != out_names_.size()) {
            return Result<std::vector<algo::Detection>>::Err(Status::Internal("SCRFD: outputs count mismatch"));
        }

        // Head geometry depends on the input shape; re-resolve when it changes.
        if (heads_.empty() || heads_w_ != tw || heads_h_ != th) {
            std::vector<Head> hs;
            Status ps = resolve_heads_(outs, tw, th, &hs);
            if (!ps.ok()) return Result<std::vector<algo::Detection>>::Err(ps);
            heads_ = std::move(hs);
            heads_w_ = tw;
            heads_h_ = th;
        }

        auto dets = decode_(heads_, outs, sx, sy, ow, oh);
        return Result<std::vector<algo::Detection>>::Ok(std::move(dets));
    } catch (const cv::Exception& e) {
        return Result<std::vector<algo::Detection>>::Err(
            Status::Internal(std::string("SCRFD::infer: OpenCV: ") + e.what()));
    } catch (const std::bad_alloc&) {
        return Result<std::vector<algo::Detection>>::Err(Status::OutOfMemory("SCRFD::infer: bad_alloc"));
    } catch (const std::exception& e) {
        return Result<std::vector<algo::Detection>>::Err(
            Status::Internal(std::string("SCRFD::infer: ") + e.what()));
    }
}

} // namespace enroll::engine
