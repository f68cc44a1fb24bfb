/**
 * @file image_decoder.h
 * @brief Asynchronous decode step of the pipeline.
 */

#pragma once

#include "event_loop.h"
#include "export.h"
#include "image.h"
#include "status.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace enroll {

using DecodeCallback = std::function<void(Result<Image>)>;

/**
 * @brief Turns encoded bytes into pixels; completion is reported once through @p done.
 *
 * The decoded @ref Image owns its buffer through the lifetime token. Whoever holds the last copy
 * decides when the buffer is released.
 */
class ENROLL_API ImageDecoder {
  public:
    virtual ~ImageDecoder() noexcept = default;

    virtual void decode(std::shared_ptr<const std::vector<std::uint8_t>> bytes, DecodeCallback done) = 0;
};

/**
 * @brief stb_image based decoder producing BGR_U8 images; decoding runs as an @ref EventLoop task.
 */
class ENROLL_API StbImageDecoder final : public ImageDecoder {
  public:
    explicit StbImageDecoder(EventLoop& loop) noexcept : loop_(loop) {}

    void decode(std::shared_ptr<const std::vector<std::uint8_t>> bytes, DecodeCallback done) override;

  private:
    EventLoop& loop_;
};

} // namespace enroll
