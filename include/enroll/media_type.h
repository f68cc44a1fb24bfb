/**
 * @file media_type.h
 * @brief Media type detection from leading magic bytes.
 */

#pragma once

#include "export.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace enroll {

/**
 * @brief Returns "image/jpeg", "image/png", "image/gif", "image/bmp" or "image/webp" when the
 * signature matches, otherwise "application/octet-stream".
 */
[[nodiscard]] ENROLL_API std::string sniff_media_type(const std::uint8_t* data, std::size_t size);

} // namespace enroll
