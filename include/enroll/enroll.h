/**
 * @file enroll.h
 * @brief Umbrella header of the enroll photo intake library.
 *
 * @defgroup enroll_api enroll Public API
 */

#pragma once

#include "config.h"            // IWYU pragma: export
#include "detection_client.h"  // IWYU pragma: export
#include "embedding.h"         // IWYU pragma: export
#include "event_loop.h"        // IWYU pragma: export
#include "export.h"            // IWYU pragma: export
#include "face_cropper.h"      // IWYU pragma: export
#include "image.h"             // IWYU pragma: export
#include "image_decoder.h"     // IWYU pragma: export
#include "media_type.h"        // IWYU pragma: export
#include "model_service.h"     // IWYU pragma: export
#include "orchestrator.h"      // IWYU pragma: export
#include "quality_gate.h"      // IWYU pragma: export
#include "scan_error.h"        // IWYU pragma: export
#include "status.h"            // IWYU pragma: export
#include "types.h"             // IWYU pragma: export
#include "validators.h"        // IWYU pragma: export
