/**
 * @file orchestrator.h
 * @brief State machine sequencing validation, decode, detection, gating, cropping and re-embedding.
 *
 * One orchestrator serves one enrollment slot of the host UI. Each selected file starts a new
 * generation; everything asynchronous is stamped with that generation and ignored on arrival if
 * the slot has moved on (new file, reset, or the orchestrator was destroyed).
 *
 * @code
 * enroll::EventLoop loop;
 * enroll::StbImageDecoder decoder(loop);
 * enroll::ModelService models;
 * models.initialize(factory);
 *
 * enroll::HostCallbacks host;
 * host.on_photo_accepted = [](const enroll::ScanResult& r) { store(r.crop_jpeg, r.embedding); };
 * host.on_photo_rejected = [](enroll::ErrorKind, const std::string& msg) { show(msg); };
 *
 * auto orch = enroll::ScanOrchestrator::create(enroll::PipelineConfig{}, models, decoder, host);
 * orch.value()->select_file(enroll::RawImageInput::from_bytes(bytes, "image/jpeg"));
 * loop.run_until_idle();
 * @endcode
 */

#pragma once

#include "config.h"
#include "detection_client.h"
#include "export.h"
#include "face_cropper.h"
#include "image_decoder.h"
#include "model_service.h"
#include "quality_gate.h"
#include "scan_error.h"
#include "status.h"
#include "types.h"
#include "validators.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace enroll {

/** @brief What the host displays: stage, gauges, error and the detected box of the current generation. */
struct ScanSnapshot {
    std::uint64_t generation = 0;
    ScanStage stage = ScanStage::Idle;
    ScanProgress progress{};
    std::optional<ScanError> error{};
    std::optional<ImageDimensions> dims{};
    std::optional<BoundingBox> bbox{};
};

/**
 * @brief Narrow host contract. Any member may be empty.
 *
 * Callbacks run on the event loop thread. They may call back into the orchestrator
 * (e.g. select another file from @ref on_photo_rejected).
 */
struct HostCallbacks {
    std::function<void(const ScanSnapshot&)> on_state_changed;
    std::function<void(const ScanResult&)> on_photo_accepted;
    std::function<void(ErrorKind, const std::string&)> on_photo_rejected;
};

class ENROLL_API ScanOrchestrator final {
  public:
    /**
     * @brief Validates @p cfg and builds an orchestrator.
     *
     * @p models and @p decoder are borrowed and must outlive the orchestrator.
     */
    [[nodiscard]] static Result<std::unique_ptr<ScanOrchestrator>> create(PipelineConfig cfg, ModelService& models,
                                                                          ImageDecoder& decoder,
                                                                          HostCallbacks host = {}) noexcept;

    /** @throws std::invalid_argument if @p cfg does not validate. */
    ScanOrchestrator(PipelineConfig cfg, ModelService& models, ImageDecoder& decoder, HostCallbacks host = {});

    /** @brief Voids every outstanding callback and releases the current generation's resources. */
    ~ScanOrchestrator() noexcept;

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /**
     * @brief Starts a new generation for @p input, superseding any generation in flight.
     *
     * File validation runs synchronously; a rejected file never reaches the decoder.
     */
    void select_file(RawImageInput input);

    /** @brief Abandons the current generation and returns to Idle. */
    void reset();

    [[nodiscard]] const ScanSnapshot& snapshot() const noexcept {
        return snap_;
    }

    [[nodiscard]] ScanStage stage() const noexcept {
        return snap_.stage;
    }

    [[nodiscard]] std::uint64_t generation() const noexcept {
        return generation_;
    }

    /** @brief Result of the current generation once it reached Complete. */
    [[nodiscard]] const std::optional<ScanResult>& result() const noexcept {
        return result_;
    }

    /** @brief True while the current generation still holds decoded or rendered pixels. */
    [[nodiscard]] bool holds_pixels() const noexcept;

    [[nodiscard]] const PipelineConfig& config() const noexcept {
        return cfg_;
    }

  private:
    struct Generation;

    std::uint64_t begin_generation_();
    void release_generation_() noexcept;
    bool is_current_(std::uint64_t gen) const noexcept;

    void start_decode_(std::uint64_t gen);
    void on_decoded_(std::uint64_t gen, Result<Image> r);
    void on_detected_(std::uint64_t gen, Result<DetectionResult> r);
    void run_gate_and_crop_(std::uint64_t gen);
    void on_embedded_(std::uint64_t gen, Result<EmbedResult> r);

    void enter_(ScanStage stage) noexcept;
    void fail_(ScanError err);
    void complete_(ScanResult res);

    /** @brief Publishes @ref snap_. @return false if the host destroyed us or moved to another generation. */
    bool notify_state_(std::uint64_t gen) noexcept;
    void log_(const std::string& msg) const;

    PipelineConfig cfg_;
    ModelService& models_;
    ImageDecoder& decoder_;
    HostCallbacks host_;

    FileValidator file_validator_;
    AspectRatioValidator aspect_validator_;
    QualityGate gate_;
    CropParams crop_params_;

    std::uint64_t generation_ = 0;
    std::unique_ptr<Generation> current_;
    ScanSnapshot snap_{};
    std::optional<ScanResult> result_{};

    /** @brief Expires with the orchestrator; callbacks hold a weak reference. */
    std::shared_ptr<int> alive_;
};

} // namespace enroll
