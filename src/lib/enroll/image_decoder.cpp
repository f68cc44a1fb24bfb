#include "image_decoder.h"

#include <utility>

namespace enroll {

void StbImageDecoder::decode(std::shared_ptr<const std::vector<std::uint8_t>> bytes, DecodeCallback done) {
    loop_.post([bytes = std::move(bytes), done = std::move(done)]() {
        if (!bytes) {
            done(Result<Image>::Err(Status::Invalid("StbImageDecoder: null payload")));
            return;
        }
        done(decode_image(bytes->data(), bytes->size(), PixelFormat::BGR_U8));
    });
}

} // namespace enroll
