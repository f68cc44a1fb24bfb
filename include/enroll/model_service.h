/**
 * @file model_service.h
 * @brief Owner of the detection collaborator and of its initialization state.
 */

#pragma once

#include "detection_client.h"
#include "export.h"
#include "status.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace enroll {

enum class ModelState : std::uint8_t {
    Uninitialized = 0,
    Initializing,
    Ready,
    Failed,
};

[[nodiscard]] ENROLL_API const char* to_string(ModelState s) noexcept;

/**
 * @brief Holds the @ref DetectionClient and its lifecycle {Uninitialized, Initializing, Ready, Failed}.
 *
 * One instance is created by the host and passed by reference to every orchestrator that needs
 * it; there is no process-global state. Model sessions are loaded once and shared.
 *
 * Transitions:
 * - @ref initialize : Uninitialized/Failed -> Initializing -> Ready | Failed. No-op when Ready.
 * - @ref shutdown   : any -> Uninitialized, dropping the client.
 */
class ENROLL_API ModelService final {
  public:
    using Factory = std::function<Result<std::unique_ptr<DetectionClient>>()>;

    ModelService() = default;
    ModelService(const ModelService&) = delete;
    ModelService& operator=(const ModelService&) = delete;

    /** @brief Creates the client through @p factory. Exceptions from the factory become Failed. */
    Status initialize(const Factory& factory) noexcept;

    void shutdown() noexcept;

    [[nodiscard]] ModelState state() const noexcept {
        return state_;
    }

    [[nodiscard]] bool ready() const noexcept {
        return state_ == ModelState::Ready;
    }

    /** @brief The client when Ready, otherwise nullptr. */
    [[nodiscard]] DetectionClient* client() const noexcept {
        return ready() ? client_.get() : nullptr;
    }

    /** @brief Status of the last initialization attempt. */
    [[nodiscard]] const Status& last_status() const noexcept {
        return last_status_;
    }

  private:
    ModelState state_ = ModelState::Uninitialized;
    std::unique_ptr<DetectionClient> client_;
    Status last_status_{};
};

} // namespace enroll
