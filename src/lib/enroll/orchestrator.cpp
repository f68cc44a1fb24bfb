#include "orchestrator.h"

#include "embedding.h"

#include <exception>
#include <iostream>
#include <new>
#include <stdexcept>
#include <utility>

namespace enroll {

struct ScanOrchestrator::Generation {
    std::uint64_t id = 0;
    RawImageInput input{};
    Image image{};
    DetectionResult detection{};
    std::optional<CropOutput> crop{};
};

namespace {

// Gauge that a failure in stage @p s saturates.
int* failing_gauge(ScanProgress& p, ScanStage s) noexcept {
    switch (s) {
    case ScanStage::Validating:
    case ScanStage::Detecting:
        return &p.detection;
    case ScanStage::QualityChecking:
        return &p.quality;
    case ScanStage::Cropping:
    case ScanStage::ReEmbedding:
        return &p.embedding;
    default:
        return nullptr;
    }
}

Status models_not_ready(const ModelService& models) {
    std::string msg = "models not ready (";
    msg += to_string(models.state());
    msg += ")";
    if (!models.last_status().message.empty()) msg += ": " + models.last_status().message;
    return Status::Internal(std::move(msg));
}

} // namespace

Result<std::unique_ptr<ScanOrchestrator>> ScanOrchestrator::create(PipelineConfig cfg, ModelService& models,
                                                                   ImageDecoder& decoder, HostCallbacks host) noexcept {
    try {
        Status st = cfg.validate();
        if (!st.ok()) return Result<std::unique_ptr<ScanOrchestrator>>::Err(st);
        return Result<std::unique_ptr<ScanOrchestrator>>::Ok(
            std::make_unique<ScanOrchestrator>(std::move(cfg), models, decoder, std::move(host)));
    } catch (const std::bad_alloc&) {
        return Result<std::unique_ptr<ScanOrchestrator>>::Err(Status::OutOfMemory("ScanOrchestrator::create: bad_alloc"));
    } catch (const std::exception& e) {
        return Result<std::unique_ptr<ScanOrchestrator>>::Err(
            Status::Internal(std::string("ScanOrchestrator::create: ") + e.what()));
    }
}

ScanOrchestrator::ScanOrchestrator(PipelineConfig cfg, ModelService& models, ImageDecoder& decoder,
                                   HostCallbacks host)
    : cfg_(std::move(cfg)), models_(models), decoder_(decoder), host_(std::move(host)), file_validator_(cfg_),
      aspect_validator_(cfg_), gate_(cfg_), crop_params_(CropParams::from(cfg_)), alive_(std::make_shared<int>(0)) {
    Status st = cfg_.validate();
    if (!st.ok()) throw std::invalid_argument("ScanOrchestrator: " + st.message);
}

ScanOrchestrator::~ScanOrchestrator() noexcept {
    alive_.reset();
    release_generation_();
}

bool ScanOrchestrator::holds_pixels() const noexcept {
    if (!current_) return false;
    if (current_->image) return true;
    return current_->crop.has_value() && static_cast<bool>(current_->crop->pixels);
}

std::uint64_t ScanOrchestrator::begin_generation_() {
    release_generation_();
    ++generation_;
    snap_ = ScanSnapshot{};
    snap_.generation = generation_;
    result_.reset();
    return generation_;
}

void ScanOrchestrator::release_generation_() noexcept {
    // Dropping the generation drops the last references to its bitmaps.
    current_.reset();
}

bool ScanOrchestrator::is_current_(std::uint64_t gen) const noexcept {
    return gen == generation_ && current_ && current_->id == gen;
}

void ScanOrchestrator::select_file(RawImageInput input) {
    const std::uint64_t gen = begin_generation_();
    current_ = std::make_unique<Generation>();
    current_->id = gen;
    current_->input = std::move(input);

    log_("generation " + std::to_string(gen) + ": " + std::to_string(current_->input.byte_length) + " bytes, " +
         current_->input.media_type);

    enter_(ScanStage::Validating);
    if (!notify_state_(gen)) return;

    ScanError verdict = file_validator_.validate(current_->input);
    if (!verdict.ok()) {
        fail_(std::move(verdict));
        return;
    }
    if (!current_->input.payload) {
        fail_(ScanError::ProcessingException("empty payload"));
        return;
    }
    if (!models_.ready()) {
        fail_(ScanError::from_status(models_not_ready(models_)));
        return;
    }

    snap_.progress.overall = 10;
    if (!notify_state_(gen)) return;

    start_decode_(gen);
}

void ScanOrchestrator::reset() {
    begin_generation_();
    log_("reset to generation " + std::to_string(generation_));
    notify_state_(generation_);
}

void ScanOrchestrator::start_decode_(std::uint64_t gen) {
    std::weak_ptr<int> alive = alive_;
    auto done = [this, alive, gen](Result<Image> r) {
        if (alive.expired()) return;
        on_decoded_(gen, std::move(r));
    };

    try {
        decoder_.decode(current_->input.payload, std::move(done));
    } catch (const std::exception& e) {
        if (is_current_(gen)) fail_(ScanError::ProcessingException(std::string("decode: ") + e.what()));
    } catch (...) {
        if (is_current_(gen)) fail_(ScanError::ProcessingException("decode: non-standard exception"));
    }
}

void ScanOrchestrator::on_decoded_(std::uint64_t gen, Result<Image> r) {
    if (!is_current_(gen)) {
        log_("dropping decode of stale generation " + std::to_string(gen));
        return;
    }
    if (!r.ok()) {
        fail_(ScanError::from_status(r.status()));
        return;
    }

    current_->image = std::move(r).value();
    const ImageDimensions dims{current_->image.width(), current_->image.height()};
    snap_.dims = dims;

    ScanError aspect = aspect_validator_.validate(dims);
    if (!aspect.ok()) {
        if (cfg_.aspect_policy == AspectPolicy::RejectMismatch) {
            fail_(std::move(aspect));
            return;
        }
        log_("aspect " + std::to_string(aspect.actual_ratio) + " off target, cropping to fit");
    }

    DetectionClient* client = models_.client();
    if (!client) {
        fail_(ScanError::from_status(models_not_ready(models_)));
        return;
    }

    enter_(ScanStage::Detecting);
    snap_.progress.detection = 30;
    snap_.progress.overall = 20;
    if (!notify_state_(gen)) return;

    std::weak_ptr<int> alive = alive_;
    auto done = [this, alive, gen](Result<DetectionResult> d) {
        if (alive.expired()) return;
        on_detected_(gen, std::move(d));
    };

    try {
        client->detect(current_->image, std::move(done));
    } catch (const std::exception& e) {
        if (is_current_(gen)) fail_(ScanError::ProcessingException(std::string("detect: ") + e.what()));
    } catch (...) {
        if (is_current_(gen)) fail_(ScanError::ProcessingException("detect: non-standard exception"));
    }
}

void ScanOrchestrator::on_detected_(std::uint64_t gen, Result<DetectionResult> r) {
    if (!is_current_(gen)) {
        log_("dropping detection of stale generation " + std::to_string(gen));
        return;
    }
    if (!r.ok()) {
        fail_(ScanError::from_status(r.status()));
        return;
    }

    current_->detection = std::move(r).value();
    snap_.bbox = current_->detection.bbox;

    log_("faces=" + std::to_string(current_->detection.face_count) +
         " confidence=" + std::to_string(current_->detection.confidence.value_or(0.0)) +
         " quality=" + to_string(current_->detection.quality.overall));

    enter_(ScanStage::QualityChecking);
    snap_.progress.detection = 100;
    snap_.progress.overall = 45;
    if (!notify_state_(gen)) return;

    run_gate_and_crop_(gen);
}

void ScanOrchestrator::run_gate_and_crop_(std::uint64_t gen) {
    ScanError verdict = gate_.evaluate(current_->detection);
    if (!verdict.ok()) {
        fail_(std::move(verdict));
        return;
    }

    enter_(ScanStage::Cropping);
    snap_.progress.quality = 100;
    snap_.progress.overall = 60;
    if (!notify_state_(gen)) return;

    auto crop = crop_face(current_->image, *current_->detection.bbox, crop_params_);
    if (!crop.ok()) {
        fail_(ScanError::from_status(crop.status()));
        return;
    }
    current_->crop = std::move(crop).value();
    current_->image = Image{};

    const CropRegion& reg = current_->crop->region;
    log_("crop region x=" + std::to_string(reg.x) + " y=" + std::to_string(reg.y) + " w=" + std::to_string(reg.width) +
         " h=" + std::to_string(reg.height));

    DetectionClient* client = models_.client();
    if (!client) {
        fail_(ScanError::from_status(models_not_ready(models_)));
        return;
    }

    enter_(ScanStage::ReEmbedding);
    snap_.progress.embedding = 30;
    snap_.progress.overall = 75;
    if (!notify_state_(gen)) return;

    std::weak_ptr<int> alive = alive_;
    auto done = [this, alive, gen](Result<EmbedResult> e) {
        if (alive.expired()) return;
        on_embedded_(gen, std::move(e));
    };

    try {
        client->embed(current_->crop->pixels, std::move(done));
    } catch (const std::exception& e) {
        if (is_current_(gen)) fail_(ScanError::ProcessingException(std::string("embed: ") + e.what()));
    } catch (...) {
        if (is_current_(gen)) fail_(ScanError::ProcessingException("embed: non-standard exception"));
    }
}

void ScanOrchestrator::on_embedded_(std::uint64_t gen, Result<EmbedResult> r) {
    if (!is_current_(gen)) {
        log_("dropping embedding of stale generation " + std::to_string(gen));
        return;
    }
    if (!r.ok()) {
        fail_(ScanError::from_status(r.status()));
        return;
    }

    EmbedResult emb = std::move(r).value();
    Status st = validate_embedding(emb.embedding, cfg_.embedding_dim);
    if (!st.ok()) {
        fail_(ScanError::ProcessingException(st.message));
        return;
    }

    CropOutput& crop = *current_->crop;
    ScanResult res;
    res.embedding = std::move(emb.embedding);
    res.crop_jpeg = std::move(crop.jpeg);
    res.crop_width = crop.width;
    res.crop_height = crop.height;
    res.bbox = *current_->detection.bbox;
    res.region = crop.region;
    res.crop_quality = std::move(emb.quality);

    complete_(std::move(res));
}

void ScanOrchestrator::enter_(ScanStage stage) noexcept {
    snap_.stage = stage;
}

void ScanOrchestrator::fail_(ScanError err) {
    const std::uint64_t gen = generation_;

    if (int* g = failing_gauge(snap_.progress, snap_.stage)) *g = 100;
    log_(std::string("failed in ") + to_string(snap_.stage) + ": " + to_string(err.kind) +
         (err.detail.empty() ? std::string() : " (" + err.detail + ")"));

    const ErrorKind kind = err.kind;
    const std::string message = err.user_message();

    snap_.stage = ScanStage::Error;
    snap_.error = std::move(err);
    release_generation_();

    // The generation is released, so track it by the stamped id alone.
    std::weak_ptr<int> alive = alive_;
    auto on_state = host_.on_state_changed;
    auto on_rejected = host_.on_photo_rejected;

    if (on_state) {
        try {
            on_state(snap_);
        } catch (const std::exception& e) {
            if (!alive.expired()) log_(std::string("on_state_changed threw: ") + e.what());
        } catch (...) {
            if (!alive.expired()) log_("on_state_changed threw a non-standard exception");
        }
    }
    if (alive.expired() || generation_ != gen) return;

    if (on_rejected) {
        try {
            on_rejected(kind, message);
        } catch (const std::exception& e) {
            if (!alive.expired()) log_(std::string("on_photo_rejected threw: ") + e.what());
        } catch (...) {
            if (!alive.expired()) log_("on_photo_rejected threw a non-standard exception");
        }
    }
}

void ScanOrchestrator::complete_(ScanResult res) {
    const std::uint64_t gen = generation_;

    snap_.stage = ScanStage::Complete;
    snap_.progress.embedding = 100;
    snap_.progress.overall = 100;
    result_ = std::move(res);
    release_generation_();

    log_("complete: " + std::to_string(result_->crop_jpeg.size()) + " byte crop, " +
         std::to_string(result_->embedding.size()) + "-d embedding");

    std::weak_ptr<int> alive = alive_;
    auto on_state = host_.on_state_changed;
    auto on_accepted = host_.on_photo_accepted;

    if (on_state) {
        try {
            on_state(snap_);
        } catch (const std::exception& e) {
            if (!alive.expired()) log_(std::string("on_state_changed threw: ") + e.what());
        } catch (...) {
            if (!alive.expired()) log_("on_state_changed threw a non-standard exception");
        }
    }
    if (alive.expired() || generation_ != gen || !result_) return;

    if (on_accepted) {
        const ScanResult accepted = *result_;
        try {
            on_accepted(accepted);
        } catch (const std::exception& e) {
            if (!alive.expired()) log_(std::string("on_photo_accepted threw: ") + e.what());
        } catch (...) {
            if (!alive.expired()) log_("on_photo_accepted threw a non-standard exception");
        }
    }
}

bool ScanOrchestrator::notify_state_(std::uint64_t gen) noexcept {
    std::weak_ptr<int> alive = alive_;
    auto on_state = host_.on_state_changed;
    if (on_state) {
        try {
            on_state(snap_);
        } catch (const std::exception& e) {
            if (!alive.expired()) log_(std::string("on_state_changed threw: ") + e.what());
        } catch (...) {
            if (!alive.expired()) log_("on_state_changed threw a non-standard exception");
        }
    }
    if (alive.expired()) return false;
    return is_current_(gen);
}

void ScanOrchestrator::log_(const std::string& msg) const {
    if (cfg_.verbose) std::cout << "[orchestrator] " << msg << "\n";
}

} // namespace enroll
