#include "media_type.h"

#include <cstring>

namespace enroll {

namespace {

inline bool has_prefix(const std::uint8_t* data, std::size_t size, const char* sig, std::size_t n,
                       std::size_t offset = 0) noexcept {
    return size >= offset + n && std::memcmp(data + offset, sig, n) == 0;
}

} // namespace

std::string sniff_media_type(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) return "application/octet-stream";

    if (has_prefix(data, size, "\xFF\xD8\xFF", 3)) return "image/jpeg";
    if (has_prefix(data, size, "\x89PNG\r\n\x1A\n", 8)) return "image/png";
    if (has_prefix(data, size, "GIF87a", 6) || has_prefix(data, size, "GIF89a", 6)) return "image/gif";
    if (has_prefix(data, size, "BM", 2)) return "image/bmp";
    if (has_prefix(data, size, "RIFF", 4) && has_prefix(data, size, "WEBP", 4, 8)) return "image/webp";

    return "application/octet-stream";
}

} // namespace enroll
