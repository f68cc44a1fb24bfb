/**
 * @file detection_client.h
 * @brief Boundary to the face detection / embedding collaborator.
 *
 * The pipeline never detects faces itself. It calls a @ref enroll::DetectionClient and waits for
 * the completion callback. Both operations are asynchronous, single-shot and not cancelable:
 * - the callback is invoked exactly once, either with a value or with a non-OK status;
 * - the callback may run after the caller has moved on; callers guard against stale completions;
 * - implementations must not retry on the caller's behalf.
 */

#pragma once

#include "export.h"
#include "image.h"
#include "status.h"
#include "types.h"

#include <functional>

namespace enroll {

using DetectCallback = std::function<void(Result<DetectionResult>)>;
using EmbedCallback = std::function<void(Result<EmbedResult>)>;

class ENROLL_API DetectionClient {
  public:
    virtual ~DetectionClient() noexcept = default;

    /**
     * @brief Counts faces in @p image and reports the primary face box, confidence and quality.
     *
     * Failures (malformed input, backend unavailable) are delivered as a non-OK status.
     */
    virtual void detect(const Image& image, DetectCallback done) = 0;

    /**
     * @brief Produces the enrollment embedding for an already cropped face image.
     */
    virtual void embed(const Image& image, EmbedCallback done) = 0;
};

} // namespace enroll
