#include "analysis/quality_analyzer.h"

#include <algorithm>
#include <exception>
#include <new>
#include <string>

namespace enroll::analysis {

namespace {

constexpr double kEdgeMagnitude = 30.0;
constexpr double kEdgeShare = 0.1;
constexpr double kContrastScale = 64.0;

constexpr double kDarkBelow = 0.3;
constexpr double kBrightAbove = 0.8;
constexpr double kLowContrastBelow = 0.3;
constexpr double kBlurryBelow = 0.4;
constexpr double kSmallFaceBelow = 0.15;
constexpr double kLargeFaceAbove = 0.8;
constexpr double kMinResolutionPx = 100.0;

QualityLevel level_from_score(int score) noexcept {
    switch (score) {
    case 5:
        return QualityLevel::Excellent;
    case 4:
        return QualityLevel::Good;
    case 3:
        return QualityLevel::Fair;
    case 2:
        return QualityLevel::Poor;
    default:
        return QualityLevel::Unacceptable;
    }
}

} // namespace

QualityReport grade_quality(const QualityMetrics& m) {
    QualityReport r;

    if (m.brightness < kDarkBelow) r.issues.emplace_back("Image too dark");
    if (m.brightness > kBrightAbove) r.issues.emplace_back("Image too bright");
    if (m.contrast < kLowContrastBelow) r.issues.emplace_back("Low contrast");
    if (m.sharpness < kBlurryBelow) r.issues.emplace_back("Image blurry");
    if (m.face_size < kSmallFaceBelow) r.issues.emplace_back("Face too small");
    if (m.face_size > kLargeFaceAbove) r.issues.emplace_back("Face too large/cropped");
    if (m.face_resolution < kMinResolutionPx) r.issues.emplace_back("Face resolution too low");

    int score = 0;
    if (m.brightness >= 0.3 && m.brightness <= 0.8) ++score;
    if (m.contrast >= 0.5) ++score;
    if (m.sharpness >= 0.6) ++score;
    if (m.face_size >= 0.2 && m.face_size <= 0.7) ++score;
    if (m.face_resolution >= kMinResolutionPx) ++score;

    r.overall = level_from_score(score);
    return r;
}

Result<QualityAnalysis> analyze_quality(const cv::Mat& bgr, const cv::Rect& face) noexcept {
    try {
        if (bgr.empty() || bgr.type() != CV_8UC3) {
            return Result<QualityAnalysis>::Err(Status::Invalid("analyze_quality: expected CV_8UC3 BGR"));
        }

        const cv::Rect face_px = face & cv::Rect(0, 0, bgr.cols, bgr.rows);
        const cv::Rect region = face_px.area() > 0 ? face_px : cv::Rect(0, 0, bgr.cols, bgr.rows);

        cv::Mat gray;
        cv::cvtColor(bgr(region), gray, cv::COLOR_BGR2GRAY);

        cv::Scalar mean, stddev;
        cv::meanStdDev(gray, mean, stddev);

        cv::Mat gx, gy, mag;
        cv::Sobel(gray, gx, CV_32F, 1, 0, 3);
        cv::Sobel(gray, gy, CV_32F, 0, 1, 3);
        cv::magnitude(gx, gy, mag);
        const int edges = cv::countNonZero(mag > kEdgeMagnitude);

        QualityAnalysis out;
        QualityMetrics& m = out.metrics;
        m.brightness = mean[0] / 255.0;
        m.contrast = std::min(1.0, stddev[0] / kContrastScale);
        m.sharpness = std::min(1.0, (double)edges / (kEdgeShare * (double)region.area()));

        const double img_area = (double)bgr.cols * (double)bgr.rows;
        m.face_size = face_px.area() > 0 ? (double)face_px.area() / img_area : 0.0;
        m.face_resolution = face_px.area() > 0 ? (double)std::min(face_px.width, face_px.height) : 0.0;

        out.report = grade_quality(m);
        return Result<QualityAnalysis>::Ok(std::move(out));
    } catch (const cv::Exception& e) {
        return Result<QualityAnalysis>::Err(Status::Internal(std::string("analyze_quality: OpenCV: ") + e.what()));
    } catch (const std::bad_alloc&) {
        return Result<QualityAnalysis>::Err(Status::OutOfMemory("analyze_quality: bad_alloc"));
    } catch (const std::exception& e) {
        return Result<QualityAnalysis>::Err(Status::Internal(std::string("analyze_quality: ") + e.what()));
    }
}

} // namespace enroll::analysis
