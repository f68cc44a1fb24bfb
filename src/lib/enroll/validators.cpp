#include "validators.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace enroll {

namespace {

bool starts_with_nocase(const std::string& s, const char* prefix) noexcept {
    std::size_t i = 0;
    for (; prefix[i] != '\0'; ++i) {
        if (i >= s.size()) return false;
        const auto a = static_cast<unsigned char>(s[i]);
        const auto b = static_cast<unsigned char>(prefix[i]);
        if (std::tolower(a) != std::tolower(b)) return false;
    }
    return true;
}

} // namespace

ScanError FileValidator::validate(const RawImageInput& input) const {
    // The declared length is host-supplied; the payload is what would reach the decoder.
    const std::size_t actual = std::max(input.byte_length, input.payload ? input.payload->size() : std::size_t{0});
    if (actual > max_size_) {
        return ScanError::FileTooLarge(actual, max_size_);
    }
    if (!starts_with_nocase(input.media_type, "image/")) {
        return ScanError::InvalidFileType(input.media_type);
    }
    return ScanError::Ok();
}

ScanError AspectRatioValidator::validate(const ImageDimensions& dims) const {
    if (dims.width <= 0 || dims.height <= 0) {
        return ScanError::AspectRatioMismatch(target_, 0.0);
    }
    const double ratio = static_cast<double>(dims.width) / static_cast<double>(dims.height);
    if (std::fabs(ratio - target_) > tolerance_ * target_) {
        return ScanError::AspectRatioMismatch(target_, ratio);
    }
    return ScanError::Ok();
}

} // namespace enroll
