/**
 * @file image.h
 * @brief Pixel buffers used by the intake pipeline: views, owning images and in-memory decoding.
 *
 * - @ref enroll::PixelFormat : packed 8-bit interleaved layouts.
 * - @ref enroll::ImageView   : non-owning pointer + geometry + stride.
 * - @ref enroll::Image       : view plus an optional shared lifetime token.
 *
 * The lifetime token is what makes generation-scoped release observable: an image produced by a
 * decoder holds its buffer through the token, and the buffer is freed exactly when the last copy
 * of the @ref enroll::Image goes away.
 *
 * @defgroup enroll_image Image
 * @{
 */

#pragma once

#include "export.h"
#include "status.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace enroll {

/** @brief Packed pixel formats, 8 bits per channel. */
enum class PixelFormat : std::uint8_t {
    RGB_U8 = 0,
    BGR_U8 = 1,
    RGBA_U8 = 2,
    BGRA_U8 = 3,
};

/** @brief Number of interleaved channels for @p f, 0 for unknown values. */
[[nodiscard]] constexpr int get_channels(PixelFormat f) noexcept {
    switch (f) {
    case PixelFormat::RGB_U8:
    case PixelFormat::BGR_U8:
        return 3;
    case PixelFormat::RGBA_U8:
    case PixelFormat::BGRA_U8:
        return 4;
    default:
        return 0;
    }
}

/**
 * @brief Non-owning description of packed 8-bit pixel memory.
 *
 * Valid when @ref data is set, both dimensions are positive and @ref stride_bytes covers a full row.
 */
struct ImageView final {
    const std::uint8_t* data = nullptr;
    int width = 0;
    int height = 0;
    std::size_t stride_bytes = 0;
    PixelFormat format = PixelFormat::BGR_U8;

    [[nodiscard]] constexpr bool empty() const noexcept {
        return data == nullptr || width <= 0 || height <= 0;
    }

    [[nodiscard]] constexpr int channels() const noexcept {
        return get_channels(format);
    }

    [[nodiscard]] constexpr std::size_t min_row_bytes() const noexcept {
        const int ch = channels();
        if (ch <= 0 || width <= 0) return 0;
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(ch);
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        if (empty()) return false;
        const std::size_t min_row = min_row_bytes();
        return (min_row > 0) && (stride_bytes >= min_row);
    }
};

/**
 * @brief Image value type: an @ref ImageView plus an optional @c shared_ptr<void> owner token.
 *
 * Ownership models:
 * - @ref view  : caller keeps the memory alive.
 * - @ref wrap  : the token keeps external memory alive.
 * - @ref adopt : the token runs a custom deleter when the last copy is destroyed.
 * - @ref copy_from : deep copy into an image-managed buffer.
 *
 * Copies are cheap and share the token. Pixel memory is not synchronized.
 */
class Image final {
  public:
    Image() noexcept = default;

    [[nodiscard]] static Image view(ImageView v) noexcept {
        Image img;
        img.view_ = v;
        return img;
    }

    [[nodiscard]] static Image wrap(ImageView v, std::shared_ptr<void> owner) noexcept {
        Image img;
        img.view_ = v;
        img.owner_ = std::move(owner);
        return img;
    }

    [[nodiscard]] static Image wrap(PixelFormat fmt, int w, int h, const std::uint8_t* data, std::size_t stride_bytes,
                                    std::shared_ptr<void> owner = {}) noexcept {
        ImageView v;
        v.data = data;
        v.width = w;
        v.height = h;
        v.stride_bytes = stride_bytes;
        v.format = fmt;
        return wrap(v, std::move(owner));
    }

    /**
     * @brief Takes ownership of @p data; @p deleter is called with it once the last copy dies.
     *
     * @tparam Deleter CopyConstructible callable accepting @c void*.
     */
    template <class Deleter>
    [[nodiscard]] static Image adopt(PixelFormat fmt, int w, int h, std::uint8_t* data, std::size_t stride_bytes,
                                     Deleter deleter) {
        std::shared_ptr<void> owner(data, [deleter](void* p) mutable { deleter(p); });
        return wrap(fmt, w, h, data, stride_bytes, std::move(owner));
    }

    /** @brief Deep-copies @p h rows of @p src into a tightly packed buffer owned by the result. */
    [[nodiscard]] static Result<Image> copy_from(PixelFormat fmt, int w, int h, const std::uint8_t* src,
                                                 std::size_t src_stride_bytes) noexcept;

    [[nodiscard]] const ImageView& view() const noexcept {
        return view_;
    }

    [[nodiscard]] int width() const noexcept {
        return view_.width;
    }

    [[nodiscard]] int height() const noexcept {
        return view_.height;
    }

    [[nodiscard]] const std::shared_ptr<void>& owner() const noexcept {
        return owner_;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return view_.is_valid();
    }

  private:
    ImageView view_{};
    std::shared_ptr<void> owner_{};
};

/**
 * @brief Decodes an encoded image (JPEG, PNG, BMP, GIF, ...) held in memory.
 *
 * The returned image is tightly packed in @p output_format and owns the decoder's buffer.
 *
 * @retval Status::Unsupported for a format with neither 3 nor 4 channels.
 * @retval Status::DecodeError if the bytes cannot be decoded.
 */
[[nodiscard]] ENROLL_API Result<Image> decode_image(const std::uint8_t* data, std::size_t size,
                                                    PixelFormat output_format) noexcept;

/** @brief Reads a whole file into memory. */
[[nodiscard]] ENROLL_API Result<std::vector<std::uint8_t>> read_file_bytes(const std::string& path) noexcept;

} // namespace enroll

/** @} */
