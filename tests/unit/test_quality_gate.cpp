#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "quality_gate.h"

#include <limits>
#include <string>
#include <vector>

namespace {

static enroll::DetectionResult single_face(double area_side, double confidence, enroll::QualityLevel q,
                                           std::vector<std::string> issues = {}) {
    enroll::DetectionResult d;
    d.face_count = 1;
    d.bbox = enroll::BoundingBox{0.1, 0.1, area_side, area_side};
    d.confidence = confidence;
    d.quality.overall = q;
    d.quality.issues = std::move(issues);
    return d;
}

static enroll::ScanError gate(const enroll::DetectionResult& d) {
    enroll::PipelineConfig cfg;
    return enroll::QualityGate(cfg).evaluate(d);
}

} // namespace

TEST(QualityGate, AcceptsGoodSingleFace) {
    EXPECT_TRUE(gate(single_face(0.5, 0.81, enroll::QualityLevel::Good)).ok());
    EXPECT_TRUE(gate(single_face(0.5, 1.0, enroll::QualityLevel::Excellent)).ok());
}

TEST(QualityGate, ConfidenceBoundary) {
    EXPECT_TRUE(gate(single_face(0.5, 0.80, enroll::QualityLevel::Good)).ok());

    auto e = gate(single_face(0.5, 0.79, enroll::QualityLevel::Good));
    EXPECT_EQ(e.kind, enroll::ErrorKind::LowConfidence);
}

TEST(QualityGate, NoFace) {
    enroll::DetectionResult d;
    EXPECT_EQ(gate(d).kind, enroll::ErrorKind::NoFaceDetected);
}

TEST(QualityGate, SingleFaceWithoutBoxCountsAsNoFace) {
    enroll::DetectionResult d;
    d.face_count = 1;
    d.confidence = 0.99;
    d.quality.overall = enroll::QualityLevel::Excellent;
    EXPECT_EQ(gate(d).kind, enroll::ErrorKind::NoFaceDetected);
}

TEST(QualityGate, MultipleFacesRejectedBeforeAnyOtherCheck) {
    // tiny box, low confidence and poor quality: face count still decides
    auto d = single_face(0.01, 0.1, enroll::QualityLevel::Unacceptable);
    d.face_count = 2;
    auto e = gate(d);
    EXPECT_EQ(e.kind, enroll::ErrorKind::MultipleFacesDetected);
    EXPECT_EQ(e.user_message(), "Multiple faces detected. Please upload a photo with only one face.");
}

TEST(QualityGate, FaceTooSmallPrecedesConfidence) {
    // 0.28^2 = 0.0784 < 0.08
    auto e = gate(single_face(0.28, 0.5, enroll::QualityLevel::Good));
    EXPECT_EQ(e.kind, enroll::ErrorKind::FaceTooSmall);

    // 0.3^2 = 0.09
    EXPECT_TRUE(gate(single_face(0.3, 0.9, enroll::QualityLevel::Good)).ok());
}

TEST(QualityGate, MissingConfidenceIsLow) {
    auto d = single_face(0.5, 0.9, enroll::QualityLevel::Good);
    d.confidence.reset();
    EXPECT_EQ(gate(d).kind, enroll::ErrorKind::LowConfidence);
}

TEST(QualityGate, BelowGoodIsPoorQualityWithIssues) {
    auto e = gate(single_face(0.5, 0.95, enroll::QualityLevel::Fair, {"Low contrast", "Image blurry"}));
    ASSERT_EQ(e.kind, enroll::ErrorKind::PoorQuality);
    ASSERT_EQ(e.issues.size(), 2u);
    EXPECT_EQ(e.issues[0], "Low contrast");
    EXPECT_EQ(e.user_message(), "Image quality issues: Low contrast, Image blurry. Please upload a clearer photo.");

    EXPECT_EQ(gate(single_face(0.5, 0.95, enroll::QualityLevel::Poor)).kind, enroll::ErrorKind::PoorQuality);
    EXPECT_EQ(gate(single_face(0.5, 0.95, enroll::QualityLevel::Unacceptable)).kind, enroll::ErrorKind::PoorQuality);
}

TEST(QualityGate, ExplicitReportOverridesDetectionQuality) {
    enroll::PipelineConfig cfg;
    enroll::QualityGate g(cfg);
    auto d = single_face(0.5, 0.95, enroll::QualityLevel::Excellent);

    enroll::QualityReport poor;
    poor.overall = enroll::QualityLevel::Poor;
    poor.issues = {"Image too dark"};

    EXPECT_EQ(g.evaluate(d, poor).kind, enroll::ErrorKind::PoorQuality);
    EXPECT_TRUE(g.evaluate(d).ok());
}

TEST(QualityGate, SameInputSameVerdict) {
    auto d = single_face(0.5, 0.79, enroll::QualityLevel::Good);
    auto a = gate(d);
    auto b = gate(d);
    EXPECT_EQ(a.kind, b.kind);
    EXPECT_EQ(a.user_message(), b.user_message());
}

TEST(QualityGate, NanConfidenceIsLow) {
    auto d = single_face(0.5, std::numeric_limits<double>::quiet_NaN(), enroll::QualityLevel::Excellent);
    EXPECT_EQ(gate(d).kind, enroll::ErrorKind::LowConfidence);
}

TEST(QualityGate, NegativeConfidenceIsLow) {
    EXPECT_EQ(gate(single_face(0.5, -0.5, enroll::QualityLevel::Excellent)).kind, enroll::ErrorKind::LowConfidence);
}

TEST(QualityGate, ConfidenceAboveOneIsRejected) {
    auto e = gate(single_face(0.5, 1.5, enroll::QualityLevel::Excellent));
    EXPECT_EQ(e.kind, enroll::ErrorKind::ProcessingException);
}

TEST(QualityGate, NonFiniteBoxIsRejected) {
    auto d = single_face(0.5, 0.95, enroll::QualityLevel::Excellent);
    d.bbox->width = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(gate(d).kind, enroll::ErrorKind::ProcessingException);

    d.bbox->width = std::numeric_limits<double>::infinity();
    EXPECT_EQ(gate(d).kind, enroll::ErrorKind::ProcessingException);
}

TEST(QualityGate, BoxOutsideUnitSquareIsRejected) {
    auto d = single_face(0.5, 0.95, enroll::QualityLevel::Excellent);
    d.bbox = enroll::BoundingBox{0.8, 0.2, 0.4, 0.5};
    EXPECT_EQ(gate(d).kind, enroll::ErrorKind::ProcessingException);

    d.bbox = enroll::BoundingBox{-0.1, 0.2, 0.4, 0.5};
    EXPECT_EQ(gate(d).kind, enroll::ErrorKind::ProcessingException);
}
