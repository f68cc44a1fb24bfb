#include "model_service.h"

#include <exception>
#include <new>
#include <string>
#include <utility>

namespace enroll {

const char* to_string(ModelState s) noexcept {
    switch (s) {
    case ModelState::Uninitialized:
        return "uninitialized";
    case ModelState::Initializing:
        return "initializing";
    case ModelState::Ready:
        return "ready";
    case ModelState::Failed:
        return "failed";
    }
    return "unknown";
}

Status ModelService::initialize(const Factory& factory) noexcept {
    if (state_ == ModelState::Ready) return Status::Ok();
    if (state_ == ModelState::Initializing) return Status::Invalid("ModelService: initialization already running");
    if (!factory) {
        state_ = ModelState::Failed;
        last_status_ = Status::Invalid("ModelService: empty factory");
        return last_status_;
    }

    state_ = ModelState::Initializing;
    client_.reset();

    try {
        auto r = factory();
        if (!r.ok()) {
            last_status_ = r.status();
        } else if (!r.value()) {
            last_status_ = Status::Internal("ModelService: factory returned null client");
        } else {
            client_ = std::move(r.value());
            last_status_ = Status::Ok();
        }
    } catch (const std::bad_alloc&) {
        last_status_ = Status::OutOfMemory("ModelService: bad_alloc");
    } catch (const std::exception& e) {
        last_status_ = Status::Internal(std::string("ModelService: factory threw: ") + e.what());
    } catch (...) {
        last_status_ = Status::Internal("ModelService: factory threw (unknown)");
    }

    state_ = last_status_.ok() ? ModelState::Ready : ModelState::Failed;
    return last_status_;
}

void ModelService::shutdown() noexcept {
    client_.reset();
    state_ = ModelState::Uninitialized;
    last_status_ = Status::Ok();
}

} // namespace enroll
