/**
 * @file image.cpp
 * @brief Deep copy, in-memory decoding (stb_image) and file reading for @ref enroll::Image.
 *
 * @note
 * This file defines @c STB_IMAGE_IMPLEMENTATION and must be the only translation unit doing so.
 */

#include "image.h"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#if defined(__has_include) && __has_include(<stb_image.h>)
    #define STB_IMAGE_IMPLEMENTATION
    #include <stb_image.h>
#elif defined(__has_include) && __has_include(<stb/stb_image.h>)
    #define STB_IMAGE_IMPLEMENTATION
    #include <stb/stb_image.h>
#else
    #error "[ERROR] 'stb_image.h' header not found"
#endif

namespace enroll {

namespace {

[[nodiscard]] constexpr bool wants_bgr(PixelFormat fmt) noexcept {
    return fmt == PixelFormat::BGR_U8 || fmt == PixelFormat::BGRA_U8;
}

/// @return True on overflow.
[[nodiscard]] bool mul_overflow_size(std::size_t a, std::size_t b, std::size_t* out) noexcept {
#if defined(__has_builtin)
    #if __has_builtin(__builtin_mul_overflow)
    return __builtin_mul_overflow(a, b, out);
    #endif
#endif
    if (a == 0 || b == 0) {
        *out = 0;
        return false;
    }
    if (a > (static_cast<std::size_t>(-1) / b)) return true;
    *out = a * b;
    return false;
}

void swap_rb_in_place(std::uint8_t* data, int w, int h, int ch) noexcept {
    const std::size_t n = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
    for (std::size_t i = 0; i < n; ++i) {
        std::uint8_t* px = data + i * static_cast<std::size_t>(ch);
        const std::uint8_t r = px[0];
        px[0] = px[2];
        px[2] = r;
    }
}

} // namespace

Result<Image> Image::copy_from(PixelFormat fmt, int w, int h, const std::uint8_t* src,
                               std::size_t src_stride_bytes) noexcept {
    ImageView in;
    in.data = src;
    in.width = w;
    in.height = h;
    in.stride_bytes = src_stride_bytes;
    in.format = fmt;

    if (!in.is_valid()) {
        return Result<Image>::Err(Status::Invalid("Image::copy_from: invalid input"));
    }

    const std::size_t row = in.min_row_bytes();
    std::size_t total = 0;
    if (mul_overflow_size(row, static_cast<std::size_t>(h), &total)) {
        return Result<Image>::Err(Status::Invalid("Image::copy_from: size overflow"));
    }

    try {
        auto buf = std::make_shared<std::vector<std::uint8_t>>(total);
        for (int y = 0; y < h; ++y) {
            std::memcpy(buf->data() + static_cast<std::size_t>(y) * row,
                        src + static_cast<std::size_t>(y) * src_stride_bytes, row);
        }
        return Result<Image>::Ok(Image::wrap(fmt, w, h, buf->data(), row, std::static_pointer_cast<void>(buf)));
    } catch (const std::bad_alloc&) {
        return Result<Image>::Err(Status::OutOfMemory("Image::copy_from: allocation failed"));
    }
}

Result<Image> decode_image(const std::uint8_t* data, std::size_t size, PixelFormat output_format) noexcept {
    const int req_ch = get_channels(output_format);
    if (req_ch != 3 && req_ch != 4) {
        return Result<Image>::Err(Status::Unsupported("decode_image: unsupported output PixelFormat"));
    }
    if (!data || size == 0) {
        return Result<Image>::Err(Status::DecodeError("decode_image: empty input"));
    }
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return Result<Image>::Err(Status::Invalid("decode_image: input too large"));
    }

    int w = 0, h = 0, n = 0;
    stbi_uc* px = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &n, req_ch);
    if (!px) {
        const char* why = stbi_failure_reason();
        return Result<Image>::Err(Status::DecodeError(std::string("decode_image: ") + (why ? why : "unknown")));
    }

    if (wants_bgr(output_format)) {
        swap_rb_in_place(px, w, h, req_ch);
    }

    const std::size_t stride = static_cast<std::size_t>(w) * static_cast<std::size_t>(req_ch);

    try {
        Image img = Image::adopt(output_format, w, h, px, stride, [](void* p) { stbi_image_free(p); });
        if (!img) {
            return Result<Image>::Err(Status::Internal("decode_image: invalid Image after adopt"));
        }
        return Result<Image>::Ok(std::move(img));
    } catch (const std::bad_alloc&) {
        // shared_ptr control block allocation failed; the buffer was released by its deleter.
        return Result<Image>::Err(Status::OutOfMemory("decode_image: bad_alloc"));
    }
}

Result<std::vector<std::uint8_t>> read_file_bytes(const std::string& path) noexcept {
    using R = Result<std::vector<std::uint8_t>>;
    try {
        std::ifstream in(path, std::ios::binary | std::ios::ate);
        if (!in) return R::Err(Status::NotFound("read_file_bytes: cannot open '" + path + "'"));

        const std::streamoff len = in.tellg();
        if (len < 0) return R::Err(Status::Internal("read_file_bytes: tellg failed for '" + path + "'"));
        in.seekg(0, std::ios::beg);

        std::vector<std::uint8_t> bytes(static_cast<std::size_t>(len));
        if (len > 0 && !in.read(reinterpret_cast<char*>(bytes.data()), len)) {
            return R::Err(Status::Internal("read_file_bytes: short read on '" + path + "'"));
        }
        return R::Ok(std::move(bytes));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("read_file_bytes: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("read_file_bytes: ") + e.what()));
    }
}

} // namespace enroll
