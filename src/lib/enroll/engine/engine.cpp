/**
 * @file engine.cpp
 * @ingroup enroll_engine
 * @brief Session creation and single-input inference shared by the ORT engines.
 */

#include "engine/engine.h"

#include <exception>
#include <iostream>
#include <new>
#include <string>

namespace enroll::engine {

OrtEngine::OrtEngine(const OrtModelConfig& cfg, const char* log_id) : cfg_(cfg), env_(global_env_(log_id)) {}

/**
 * @details
 * Session options:
 * - Graph optimization: ORT_ENABLE_ALL
 * - Execution mode: ORT_SEQUENTIAL
 * - CPU memory arena and memory pattern enabled
 * - Intra/inter-op threads from @ref OrtModelConfig when > 0
 */
Status OrtEngine::create_session_(const std::string& model_path) noexcept {
    try {
        if (model_path.empty()) return Status::Invalid("create_session: empty model path");

        so_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        so_.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        so_.EnableCpuMemArena();
        so_.EnableMemPattern();

        // 3 = ERROR
        so_.SetLogSeverityLevel(3);

        if (cfg_.ort_intra_threads > 0) so_.SetIntraOpNumThreads(cfg_.ort_intra_threads);
        if (cfg_.ort_inter_threads > 0) so_.SetInterOpNumThreads(cfg_.ort_inter_threads);

        session_ = Ort::Session(env_, model_path.c_str(), so_);
        init_io_names_();

        log_("loaded " + model_path + " (" + std::to_string(out_names_.size()) + " outputs)");
        return Status::Ok();

    } catch (const std::bad_alloc&) {
        return Status::OutOfMemory("create_session: bad_alloc");
    } catch (const Ort::Exception& e) {
        return Status::Invalid(std::string("create_session: ORT exception: ") + e.what());
    } catch (const std::exception& e) {
        return Status::Invalid(std::string("create_session: ") + e.what());
    }
}

void OrtEngine::init_io_names_() {
    Ort::AllocatedStringPtr in0 = session_.GetInputNameAllocated(0, alloc_);
    in_name_ = in0 ? in0.get() : std::string("input");

    const std::size_t nout = session_.GetOutputCount();
    out_names_.clear();
    out_names_.reserve(nout);
    for (std::size_t i = 0; i < nout; ++i) {
        Ort::AllocatedStringPtr on = session_.GetOutputNameAllocated(i, alloc_);
        out_names_.push_back(on ? on.get() : ("out_" + std::to_string(i)));
    }
}

Result<std::vector<Ort::Value>> OrtEngine::run_chw_(std::vector<float>& chw, int in_w, int in_h) noexcept {
    try {
        static Ort::MemoryInfo cpu_mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        const std::vector<int64_t> ishape = {1, 3, in_h, in_w};

        Ort::Value in_tensor =
            Ort::Value::CreateTensor<float>(cpu_mem, chw.data(), chw.size(), ishape.data(), ishape.size());

        std::vector<const char*> out_names_c;
        out_names_c.reserve(out_names_.size());
        for (auto& s : out_names_)
            out_names_c.push_back(s.c_str());

        const char* in_names[] = {in_name_.c_str()};

        auto outs =
            session_.Run(Ort::RunOptions{nullptr}, in_names, &in_tensor, 1, out_names_c.data(), out_names_c.size());
        return Result<std::vector<Ort::Value>>::Ok(std::move(outs));
    } catch (const std::bad_alloc&) {
        return Result<std::vector<Ort::Value>>::Err(Status::OutOfMemory("run: bad_alloc"));
    } catch (const Ort::Exception& e) {
        return Result<std::vector<Ort::Value>>::Err(Status::Internal(std::string("run: ORT exception: ") + e.what()));
    } catch (const std::exception& e) {
        return Result<std::vector<Ort::Value>>::Err(Status::Internal(std::string("run: ") + e.what()));
    }
}

void OrtEngine::log_(const std::string& msg) const {
    if (cfg_.verbose) std::cout << "[ort] " << msg << "\n";
}

} // namespace enroll::engine
