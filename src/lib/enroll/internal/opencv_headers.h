/**
 * @file opencv_headers.h
 * @ingroup enroll_internal
 * @brief OpenCV include shim for the modules the pipeline uses (core, imgproc, imgcodecs).
 *
 * Accepts both the plain @c opencv2/ layout and the @c opencv4/opencv2/ layout of some
 * distributions.
 */

#pragma once

#if defined(__has_include) && __has_include(<opencv4/opencv2/core.hpp>)
    #include <opencv4/opencv2/core.hpp>
#elif defined(__has_include) && __has_include(<opencv2/core.hpp>)
    #include <opencv2/core.hpp>
#else
    #error "[enroll] OpenCV header not found: opencv2/core.hpp (or opencv4/opencv2/core.hpp)"
#endif

#if defined(__has_include) && __has_include(<opencv4/opencv2/imgproc.hpp>)
    #include <opencv4/opencv2/imgproc.hpp>
#elif defined(__has_include) && __has_include(<opencv2/imgproc.hpp>)
    #include <opencv2/imgproc.hpp>
#else
    #error "[enroll] OpenCV header not found: opencv2/imgproc.hpp (or opencv4/opencv2/imgproc.hpp)"
#endif

#if defined(__has_include) && __has_include(<opencv4/opencv2/imgcodecs.hpp>)
    #include <opencv4/opencv2/imgcodecs.hpp>
#elif defined(__has_include) && __has_include(<opencv2/imgcodecs.hpp>)
    #include <opencv2/imgcodecs.hpp>
#else
    #error "[enroll] OpenCV header not found: opencv2/imgcodecs.hpp (or opencv4/opencv2/imgcodecs.hpp)"
#endif
