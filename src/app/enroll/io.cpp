#include "io.h"

#include "printer.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace io {

namespace {

std::string fmt_fixed(double v, int prec) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(prec) << v;
    return oss.str();
}

} // namespace

void write_bytes(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("write_bytes: cannot open: " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) throw std::runtime_error("write_bytes: write failed: " + path);
}

void write_embedding(const std::string& path, const std::vector<float>& embedding) {
    std::ofstream f(path, std::ios::trunc);
    if (!f) throw std::runtime_error("write_embedding: cannot open: " + path);
    f << std::setprecision(9);
    for (float v : embedding)
        f << v << "\n";
    if (!f) throw std::runtime_error("write_embedding: write failed: " + path);
}

void print_result(const enroll::ScanResult& r, const std::string& crop_path, bool color) {
    printer::Printer p{std::cout};
    p.a.enable = color;

    p.verdict(true, "face photo enrolled");
    std::cout << "\n";

    p.section("Face", 2);
    p.kv("bbox", fmt_fixed(r.bbox.x, 3) + ", " + fmt_fixed(r.bbox.y, 3) + ", " + fmt_fixed(r.bbox.width, 3) + ", " +
                     fmt_fixed(r.bbox.height, 3),
         4, p.a.cyan());
    p.kv("crop_region", std::to_string(r.region.x) + "," + std::to_string(r.region.y) + " " +
                            std::to_string(r.region.width) + "x" + std::to_string(r.region.height),
         4, p.a.cyan());

    std::cout << "\n";

    p.section("Output", 2);
    p.kv_path("crop_path", crop_path, 4);
    p.kv("crop_size", std::to_string(r.crop_width) + "x" + std::to_string(r.crop_height), 4, p.a.cyan());
    p.kv("crop_bytes", r.crop_jpeg.size(), 4, p.a.cyan());
    p.kv("embedding_dim", r.embedding.size(), 4, p.a.cyan());
    p.kv("crop_quality", enroll::to_string(r.crop_quality.overall), 4, p.a.yellow());

    std::cout << "\n";
}

} // namespace io
