#include "cli.h"

#include "printer.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace cli {

namespace {

inline std::string_view trim_view(std::string_view s) noexcept {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

inline std::string lower_copy(std::string_view sv) {
    std::string s(sv);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool parse_int(std::string_view sv, int& v) noexcept {
    sv = trim_view(sv);
    if (sv.empty()) return false;

    int tmp = 0;
    const char* first = sv.data();
    const char* last = sv.data() + sv.size();
    auto r = std::from_chars(first, last, tmp);
    if (r.ec != std::errc{} || r.ptr != last) return false;

    v = tmp;
    return true;
}

inline bool parse_float(std::string_view sv, float& v) noexcept {
    sv = trim_view(sv);
    if (sv.empty()) return false;

    std::string tmp(sv);
    char* end = nullptr;
    errno = 0;
    const float val = std::strtof(tmp.c_str(), &end);

    if (end == tmp.c_str() || *end != '\0') return false;
    if (errno == ERANGE) return false;

    v = val;
    return true;
}

inline bool parse_bool(std::string_view sv, bool& v) {
    const std::string s = lower_copy(trim_view(sv));

    if (s == "true" || s == "yes" || s == "on" || s == "1") {
        v = true;
        return true;
    }
    if (s == "false" || s == "no" || s == "off" || s == "0") {
        v = false;
        return true;
    }
    return false;
}

inline bool parse_policy(std::string_view sv, enroll::AspectPolicy& p) {
    const std::string s = lower_copy(trim_view(sv));
    if (s == "autocrop" || s == "auto") {
        p = enroll::AspectPolicy::AutoCrop;
        return true;
    }
    if (s == "reject") {
        p = enroll::AspectPolicy::RejectMismatch;
        return true;
    }
    return false;
}

static void print_usage(const char* app) {
    std::cerr << "Usage:\n"
              << "  " << app << " --image <path> --detector <scrfd.onnx> --embedder <arcface.onnx> [options]\n\n"
              << "Required:\n"
              << "  --image             STR      Photo to enroll\n"
              << "  --detector          STR      SCRFD face detector ONNX model\n"
              << "  --embedder          STR      ArcFace-style embedder ONNX model\n\n"
              << "Generic:\n"
              << "  --mime              STR      Declared media type. Default: sniffed from the file\n"
              << "  --output            STR      Crop JPEG path. Default: face_crop.jpg\n"
              << "  --embedding_out     STR      Write the embedding, one value per line. Default: off\n"
              << "  --progress          0|1      Show the progress bar. Default: 1\n"
              << "  --verbose           0|1      Verbose logging. Default: 0\n\n"
              << "Pipeline:\n"
              << "  --aspect_policy     STR      autocrop | reject. Default: autocrop\n"
              << "  --embedding_dim      N       Expected embedding length. Default: 128\n\n"
              << "Inference:\n"
              << "  --score_thresh       F       Face score threshold. Default: 0.5\n"
              << "  --nms_iou            F       NMS IoU threshold. Default: 0.4\n"
              << "  --max_img_size       N       Max detector input side. Default: 640\n\n"
              << "Runtime:\n"
              << "  --threads_intra      N       ORT threads inside a graph node. Default: 1\n"
              << "  --threads_inter      N       ORT parallelism between graph nodes. Default: 1\n\n"
              << "Exit codes:\n"
              << "  0 accepted, 2 rejected, 1 usage/IO/model error\n\n"
              << "Examples:\n"
              << "  " << app << " --image me.jpg --detector scrfd_500m.onnx --embedder w600k_mbf.onnx\n"
              << "  " << app
              << " --image me.jpg --detector scrfd.onnx --embedder arcface.onnx --aspect_policy reject "
                 "--embedding_dim 512 --embedding_out me.txt\n\n";
}

inline bool missing_value(const char* flag) {
    std::cerr << "[ERROR] " << flag << " expects a value\n";
    return false;
}

inline bool invalid_value(const char* flag, const std::string& v, const char* hint = nullptr) {
    std::cerr << "[ERROR] Invalid value for " << flag << ": '" << v << "'";
    if (hint) std::cerr << " (" << hint << ")";
    std::cerr << "\n";
    return false;
}

inline bool missing_required(const char* flag, const char* app) {
    std::cerr << "[ERROR] Missing required argument: " << flag << "\n";
    print_usage(app);
    return false;
}

} // namespace

void print_config(std::ostream& os, const AppConfig& ac, const enroll::PipelineConfig& pc,
                  const enroll::OrtModelConfig& mc, bool color) {
    printer::Printer p{os};
    p.a.enable = color;

    os << "\n========================================================\n\n";
    p.section("Enrollment Configuration");
    os << "\n";

    p.section("Generic", 2);
    p.kv_path("image_path", ac.image_path, 4);
    p.kv("media_type", ac.media_type.empty() ? std::string("(sniffed)") : ac.media_type, 4, p.a.yellow());
    p.kv_path("output_path", ac.out_path, 4);
    p.kv_path("embedding_out", ac.embedding_out, 4);
    p.kv_bool("progress", ac.progress, 4);
    p.kv_bool("verbose", pc.verbose, 4);

    os << "\n";

    p.section("Pipeline", 2);
    p.kv("max_file_size", pc.max_file_size, 4, p.a.cyan());
    p.kv("target_aspect", pc.target_aspect_ratio, 4, p.a.cyan());
    p.kv("aspect_tolerance", pc.aspect_tolerance, 4, p.a.cyan());
    p.kv("aspect_policy", enroll::to_string(pc.aspect_policy), 4, p.a.yellow());
    p.kv("padding_ratio", pc.padding_ratio, 4, p.a.cyan());
    p.kv("min_face_area", pc.min_face_area, 4, p.a.cyan());
    p.kv("min_confidence", pc.min_confidence, 4, p.a.cyan());
    p.kv("min_quality", enroll::to_string(pc.min_quality), 4, p.a.yellow());
    p.kv("output_size", std::to_string(pc.output_width) + "x" + std::to_string(pc.output_height()), 4, p.a.cyan());
    p.kv("jpeg_quality", pc.jpeg_quality, 4, p.a.cyan());
    p.kv("embedding_dim", pc.embedding_dim, 4, p.a.cyan());

    os << "\n";

    p.section("Models", 2);
    p.kv_path("detector_path", mc.detector_path, 4);
    p.kv_path("embedder_path", mc.embedder_path, 4);
    p.kv("score_thresh", mc.score_thresh, 4, p.a.cyan());
    p.kv("nms_iou", mc.nms_iou, 4, p.a.cyan());
    p.kv("max_img_size", mc.max_img_size, 4, p.a.cyan());
    p.kv("min_face_px", mc.min_face_px, 4, p.a.cyan());
    p.kv_bool("apply_sigmoid", mc.apply_sigmoid, 4);

    os << "\n";

    p.section("Runtime", 2);
    p.kv("ort_intra_threads", mc.ort_intra_threads, 4, p.a.cyan());
    p.kv("ort_inter_threads", mc.ort_inter_threads, 4, p.a.cyan());

    os << "\n========================================================\n\n";
}

bool parse_arguments(int argc, char** argv, AppConfig& ac, enroll::PipelineConfig& pc, enroll::OrtModelConfig& mc) {
    if (argc <= 1) {
        print_usage(argv[0]);
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return false;
        }

        // support --flag=value
        std::string inline_val;
        if (auto eq = a.find('='); eq != std::string::npos) {
            inline_val = a.substr(eq + 1);
            a = a.substr(0, eq);
        }

        auto next = [&](std::string& out) -> bool {
            if (!inline_val.empty()) {
                out = inline_val;
                inline_val.clear();
                return true;
            }
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        std::string v;

        if (a == "--image") {
            if (!next(v)) return missing_value("--image");
            ac.image_path = v;

        } else if (a == "--detector") {
            if (!next(v)) return missing_value("--detector");
            mc.detector_path = v;

        } else if (a == "--embedder") {
            if (!next(v)) return missing_value("--embedder");
            mc.embedder_path = v;

        } else if (a == "--mime") {
            if (!next(v)) return missing_value("--mime");
            ac.media_type = std::string(trim_view(v));

        } else if (a == "--output") {
            if (!next(v)) return missing_value("--output");
            ac.out_path = v;

        } else if (a == "--embedding_out") {
            if (!next(v)) return missing_value("--embedding_out");
            ac.embedding_out = v;

        } else if (a == "--aspect_policy") {
            if (!next(v)) return missing_value("--aspect_policy");
            if (!parse_policy(v, pc.aspect_policy)) return invalid_value("--aspect_policy", v, "expected autocrop|reject");

        } else if (a == "--embedding_dim") {
            if (!next(v)) return missing_value("--embedding_dim");
            if (!parse_int(v, pc.embedding_dim) || pc.embedding_dim <= 0)
                return invalid_value("--embedding_dim", v, "expected positive integer");

        } else if (a == "--score_thresh") {
            if (!next(v)) return missing_value("--score_thresh");
            if (!parse_float(v, mc.score_thresh) || mc.score_thresh < 0.0f || mc.score_thresh > 1.0f)
                return invalid_value("--score_thresh", v, "expected 0 <= x <= 1");

        } else if (a == "--nms_iou") {
            if (!next(v)) return missing_value("--nms_iou");
            if (!parse_float(v, mc.nms_iou) || mc.nms_iou < 0.0f || mc.nms_iou > 1.0f)
                return invalid_value("--nms_iou", v, "expected 0 <= x <= 1");

        } else if (a == "--max_img_size") {
            if (!next(v)) return missing_value("--max_img_size");
            if (!parse_int(v, mc.max_img_size) || mc.max_img_size < 32)
                return invalid_value("--max_img_size", v, "expected integer >= 32");

        } else if (a == "--threads_intra") {
            if (!next(v)) return missing_value("--threads_intra");
            if (!parse_int(v, mc.ort_intra_threads) || mc.ort_intra_threads <= 0)
                return invalid_value("--threads_intra", v, "expected positive integer");

        } else if (a == "--threads_inter") {
            if (!next(v)) return missing_value("--threads_inter");
            if (!parse_int(v, mc.ort_inter_threads) || mc.ort_inter_threads <= 0)
                return invalid_value("--threads_inter", v, "expected positive integer");

        } else if (a == "--progress") {
            if (!next(v)) return missing_value("--progress");
            if (!parse_bool(v, ac.progress)) return invalid_value("--progress", v, "expected 0|1|true|false");

        } else if (a == "--verbose") {
            if (!next(v)) return missing_value("--verbose");
            if (!parse_bool(v, pc.verbose)) return invalid_value("--verbose", v, "expected 0|1|true|false");
            mc.verbose = pc.verbose;

        } else {
            std::cerr << "[ERROR] Unknown argument: " << a << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    if (ac.image_path.empty()) return missing_required("--image", argv[0]);
    if (mc.detector_path.empty()) return missing_required("--detector", argv[0]);
    if (mc.embedder_path.empty()) return missing_required("--embedder", argv[0]);

    return true;
}

} // namespace cli
