#include "cli.h"
#include "io.h"
#include "progress_bar.h"

#include <enroll.h>
#include <iostream>
#include <optional>
#include <ort_client.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitRejected = 2;

int run(int argc, char** argv) {
    // Create configs
    enroll::PipelineConfig pipe_config{};
    enroll::OrtModelConfig model_config{};
    cli::AppConfig app_config{};

    // Parse arguments and fill configs
    if (!cli::parse_arguments(argc, argv, app_config, pipe_config, model_config)) {
        throw std::runtime_error("[ERROR] Failed to parse arguments!");
    }

    // Display config
    if (pipe_config.verbose) {
        cli::print_config(std::cout, app_config, pipe_config, model_config);
    }

    // Load models
    enroll::EventLoop loop;
    enroll::ModelService models;
    const auto init_st =
        models.initialize([&]() { return enroll::create_ort_detection_client(model_config, loop); });
    if (!init_st.ok()) {
        throw std::runtime_error("[ERROR] Failed to load models: " + init_st.message);
    }

    // Read the photo
    auto bytes_res = enroll::read_file_bytes(app_config.image_path);
    if (!bytes_res.ok()) {
        throw std::runtime_error("[ERROR] Failed to read image: " + bytes_res.status().message);
    }
    std::vector<std::uint8_t> bytes = std::move(bytes_res.value());
    std::string media_type = app_config.media_type;
    if (media_type.empty()) media_type = enroll::sniff_media_type(bytes.data(), bytes.size());

    if (pipe_config.verbose) {
        std::cout << "[app_info] file bytes  : " << bytes.size() << "\n";
        std::cout << "[app_info] media type  : " << media_type << "\n";
    }

    // Wire the host side
    bar::StageBar progress(app_config.progress && !pipe_config.verbose);
    std::optional<enroll::ScanResult> accepted;
    std::optional<std::pair<enroll::ErrorKind, std::string>> rejected;

    enroll::HostCallbacks host;
    host.on_state_changed = [&](const enroll::ScanSnapshot& s) {
        if (s.stage == enroll::ScanStage::Error) {
            progress.finish(enroll::to_string(s.stage), bar::Color::red);
        } else if (s.stage == enroll::ScanStage::Complete) {
            progress.finish(enroll::to_string(s.stage), bar::Color::green);
        } else {
            progress.update(enroll::to_string(s.stage), s.progress.overall);
        }
    };
    host.on_photo_accepted = [&](const enroll::ScanResult& r) { accepted = r; };
    host.on_photo_rejected = [&](enroll::ErrorKind k, const std::string& msg) { rejected.emplace(k, msg); };

    enroll::StbImageDecoder decoder(loop);
    auto orch_res = enroll::ScanOrchestrator::create(pipe_config, models, decoder, host);
    if (!orch_res.ok()) {
        throw std::runtime_error("[ERROR] Failed to create pipeline: " + orch_res.status().message);
    }
    auto orchestrator = std::move(orch_res.value());

    // Run the pipeline to a terminal state
    orchestrator->select_file(enroll::RawImageInput::from_bytes(std::move(bytes), media_type));
    const std::size_t tasks = loop.run_until_idle();

    if (pipe_config.verbose) {
        std::cout << "[app_info] loop tasks  : " << tasks << "\n";
        std::cout << "[app_info] final stage : " << enroll::to_string(orchestrator->stage()) << "\n\n";
    }

    if (rejected) {
        std::cerr << "rejected: " << enroll::to_string(rejected->first) << "\n" << rejected->second << "\n";
        const auto& err = orchestrator->snapshot().error;
        if (pipe_config.verbose && err && !err->detail.empty()) {
            std::cerr << "[app_info] detail      : " << err->detail << "\n";
        }
        return kExitRejected;
    }

    if (!accepted) {
        throw std::runtime_error(std::string("[ERROR] Pipeline stopped in stage ") +
                                 enroll::to_string(orchestrator->stage()));
    }

    // Write results
    io::write_bytes(app_config.out_path, accepted->crop_jpeg);
    if (!app_config.embedding_out.empty()) io::write_embedding(app_config.embedding_out, accepted->embedding);

    io::print_result(*accepted, app_config.out_path);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
