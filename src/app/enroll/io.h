#pragma once

#include <cstdint>
#include <enroll.h>
#include <string>
#include <vector>

namespace io {

/** @throws std::runtime_error if the file cannot be written. */
void write_bytes(const std::string& path, const std::vector<std::uint8_t>& bytes);

/** @brief Writes one value per line. @throws std::runtime_error on failure. */
void write_embedding(const std::string& path, const std::vector<float>& embedding);

void print_result(const enroll::ScanResult& r, const std::string& crop_path, bool color = true);

} // namespace io
