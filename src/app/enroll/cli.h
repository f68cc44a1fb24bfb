#pragma once

#include <enroll.h>
#include <iosfwd>
#include <ort_client.h>
#include <string>

namespace cli {

struct AppConfig {
    std::string image_path;
    std::string media_type; // empty: sniffed from the file
    std::string out_path = "face_crop.jpg";
    std::string embedding_out;
    bool progress = true;
};

void print_config(std::ostream& os, const AppConfig& ac, const enroll::PipelineConfig& pc,
                  const enroll::OrtModelConfig& mc, bool color = true);

[[nodiscard]] bool parse_arguments(int argc, char** argv, AppConfig& ac, enroll::PipelineConfig& pc,
                                   enroll::OrtModelConfig& mc);

} // namespace cli
