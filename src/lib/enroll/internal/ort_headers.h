/**
 * @file ort_headers.h
 * @ingroup enroll_internal
 * @brief ONNX Runtime C++ API include shim (source-tree, packaged and flat install layouts).
 */

#pragma once

#if defined(__has_include) && __has_include(<onnxruntime/core/session/onnxruntime_cxx_api.h>)
    #include <onnxruntime/core/session/onnxruntime_cxx_api.h>
#elif defined(__has_include) && __has_include(<onnxruntime/onnxruntime_cxx_api.h>)
    #include <onnxruntime/onnxruntime_cxx_api.h>
#elif defined(__has_include) && __has_include(<onnxruntime_cxx_api.h>)
    #include <onnxruntime_cxx_api.h>
#else
    #error "[enroll] ONNX Runtime header not found: onnxruntime_cxx_api.h"
#endif
