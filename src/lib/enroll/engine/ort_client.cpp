/**
 * @file ort_client.cpp
 * @ingroup enroll_engine
 * @brief @ref enroll::DetectionClient backed by the SCRFD and ArcFace engines.
 *
 * @details
 * Every request is posted to the @ref enroll::EventLoop and completes from there. The engines live
 * in a shared state; a request that runs after the client was destroyed completes with an error
 * instead of touching freed engines.
 */

#include "ort_client.h"

#include "algo/nms.h"
#include "analysis/quality_analyzer.h"
#include "engine/arcface.h"
#include "engine/scrfd.h"
#include "internal/cv_bgr.h"

#include <exception>
#include <iostream>
#include <new>
#include <string>
#include <utility>

namespace enroll {

Status OrtModelConfig::validate() const noexcept {
    if (detector_path.empty()) return Status::Invalid("OrtModelConfig: detector_path is empty");
    if (embedder_path.empty()) return Status::Invalid("OrtModelConfig: embedder_path is empty");
    if (ort_intra_threads < 0 || ort_inter_threads < 0)
        return Status::Invalid("OrtModelConfig: thread counts must be >= 0");
    if (!(score_thresh >= 0.0f && score_thresh <= 1.0f))
        return Status::Invalid("OrtModelConfig: score_thresh must be in [0, 1]");
    if (!(nms_iou >= 0.0f && nms_iou <= 1.0f)) return Status::Invalid("OrtModelConfig: nms_iou must be in [0, 1]");
    if (max_img_size < 32) return Status::Invalid("OrtModelConfig: max_img_size must be >= 32");
    if (min_face_px < 0) return Status::Invalid("OrtModelConfig: min_face_px must be >= 0");
    return Status::Ok();
}

namespace {

struct Engines {
    OrtModelConfig cfg;
    std::unique_ptr<engine::ScrfdEngine> scrfd;
    std::unique_ptr<engine::ArcFaceEngine> arcface;

    void log(const std::string& msg) const {
        if (cfg.verbose) std::cout << "[ort] " << msg << "\n";
    }

    Result<std::vector<algo::Detection>> faces(const cv::Mat& bgr) const {
        auto r = scrfd->infer(bgr);
        if (!r.ok()) return r;
        return Result<std::vector<algo::Detection>>::Ok(algo::nms_boxes(r.value(), cfg.nms_iou));
    }

    Result<DetectionResult> detect(const Image& image) const {
        auto m = internal::BgrMat::from(image);
        if (!m.ok()) return Result<DetectionResult>::Err(m.status());
        const cv::Mat& bgr = m.value().mat();

        auto f = faces(bgr);
        if (!f.ok()) return Result<DetectionResult>::Err(f.status());
        const auto& dets = f.value();

        DetectionResult out;
        out.face_count = (int)dets.size();

        cv::Rect face_px;
        if (!dets.empty()) {
            const algo::Detection& best = dets.front();
            out.bbox = algo::to_normalized(best.box, bgr.cols, bgr.rows);
            out.confidence = (double)best.score;
            face_px = algo::to_pixels(*out.bbox, bgr.cols, bgr.rows);
        }

        auto q = analysis::analyze_quality(bgr, face_px);
        if (!q.ok()) return Result<DetectionResult>::Err(q.status());
        out.quality = q.value().report;

        log("detect: " + std::to_string(out.face_count) + " face(s), quality " + to_string(out.quality.overall));
        return Result<DetectionResult>::Ok(std::move(out));
    }

    Result<EmbedResult> embed(const Image& image) const {
        auto m = internal::BgrMat::from(image);
        if (!m.ok()) return Result<EmbedResult>::Err(m.status());
        const cv::Mat& bgr = m.value().mat();

        // The crop is already centred on the face; locate it again for a tight chip.
        cv::Rect face_px(0, 0, bgr.cols, bgr.rows);
        auto f = faces(bgr);
        if (!f.ok()) return Result<EmbedResult>::Err(f.status());
        if (!f.value().empty()) {
            const cv::Rect r = cv::Rect(f.value().front().box) & face_px;
            if (r.area() > 0) face_px = r;
        } else {
            log("embed: no face in crop, embedding the whole crop");
        }

        auto e = arcface->embed(bgr(face_px));
        if (!e.ok()) return Result<EmbedResult>::Err(e.status());

        auto q = analysis::analyze_quality(bgr, face_px);
        if (!q.ok()) return Result<EmbedResult>::Err(q.status());

        EmbedResult out;
        out.embedding = std::move(e.value());
        out.quality = q.value().report;

        log("embed: " + std::to_string(out.embedding.size()) + "-d, crop quality " + to_string(out.quality.overall));
        return Result<EmbedResult>::Ok(std::move(out));
    }
};

class OrtDetectionClient final : public DetectionClient {
  public:
    OrtDetectionClient(std::shared_ptr<Engines> engines, EventLoop& loop) noexcept
        : engines_(std::move(engines)), loop_(loop) {}

    void detect(const Image& image, DetectCallback done) override {
        std::weak_ptr<Engines> weak = engines_;
        loop_.post([weak, image, done = std::move(done)]() {
            auto e = weak.lock();
            if (!e) {
                done(Result<DetectionResult>::Err(Status::Internal("detect: detection client shut down")));
                return;
            }
            done(e->detect(image));
        });
    }

    void embed(const Image& image, EmbedCallback done) override {
        std::weak_ptr<Engines> weak = engines_;
        loop_.post([weak, image, done = std::move(done)]() {
            auto e = weak.lock();
            if (!e) {
                done(Result<EmbedResult>::Err(Status::Internal("embed: detection client shut down")));
                return;
            }
            done(e->embed(image));
        });
    }

  private:
    std::shared_ptr<Engines> engines_;
    EventLoop& loop_;
};

} // namespace

Result<std::unique_ptr<DetectionClient>> create_ort_detection_client(const OrtModelConfig& cfg,
                                                                     EventLoop& loop) noexcept {
    using R = Result<std::unique_ptr<DetectionClient>>;
    try {
        const Status vs = cfg.validate();
        if (!vs.ok()) return R::Err(vs);

        auto engines = std::make_shared<Engines>();
        engines->cfg = cfg;

        auto det = engine::ScrfdEngine::create(cfg);
        if (!det.ok()) return R::Err(det.status());
        engines->scrfd = std::move(det.value());

        auto emb = engine::ArcFaceEngine::create(cfg);
        if (!emb.ok()) return R::Err(emb.status());
        engines->arcface = std::move(emb.value());

        engines->log("embedder input " + std::to_string(engines->arcface->input_size()) + "x" +
                     std::to_string(engines->arcface->input_size()));

        return R::Ok(std::make_unique<OrtDetectionClient>(std::move(engines), loop));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("create_ort_detection_client: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("create_ort_detection_client: ") + e.what()));
    }
}

} // namespace enroll
