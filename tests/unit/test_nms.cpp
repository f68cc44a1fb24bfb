#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "algo/nms.h"

#include <cstddef>
#include <vector>

namespace {

static enroll::algo::Detection box(float x, float y, float w, float h, float score) {
    enroll::algo::Detection d;
    d.box = cv::Rect2f(x, y, w, h);
    d.score = score;
    return d;
}

static bool is_sorted_desc(const std::vector<enroll::algo::Detection>& v) {
    for (std::size_t i = 1; i < v.size(); ++i) {
        if (v[i - 1].score < v[i].score) return false;
    }
    return true;
}

} // namespace

TEST(NMS, EmptyInput) {
    EXPECT_TRUE(enroll::algo::nms_boxes({}, 0.4f).empty());
}

TEST(NMS, ThrLeZeroMeansSortedOnly) {
    std::vector<enroll::algo::Detection> dets = {box(0, 0, 10, 10, 0.2f), box(0, 0, 10, 10, 0.9f),
                                                 box(0, 0, 10, 10, 0.5f)};

    auto out = enroll::algo::nms_boxes(dets, 0.0f);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_TRUE(is_sorted_desc(out));
    EXPECT_FLOAT_EQ(out[0].score, 0.9f);
}

TEST(NMS, ThrGeOneKeepsSingleBest) {
    std::vector<enroll::algo::Detection> dets = {box(0, 0, 10, 10, 0.2f), box(100, 100, 10, 10, 0.7f),
                                                 box(200, 0, 10, 10, 0.5f)};

    auto out = enroll::algo::nms_boxes(dets, 1.0f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FLOAT_EQ(out[0].score, 0.7f);
}

TEST(NMS, OverlappingFaceCollapsesToBest) {
    // IoU of the two boxes is 81 / 119 ~ 0.68
    std::vector<enroll::algo::Detection> dets = {box(0, 0, 10, 10, 0.8f), box(1, 1, 10, 10, 0.95f)};

    auto out = enroll::algo::nms_boxes(dets, 0.4f);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FLOAT_EQ(out[0].score, 0.95f);
}

TEST(NMS, SeparateFacesSurvive) {
    std::vector<enroll::algo::Detection> dets = {box(0, 0, 50, 50, 0.9f), box(100, 0, 50, 50, 0.85f),
                                                 box(2, 2, 50, 50, 0.6f)};

    auto out = enroll::algo::nms_boxes(dets, 0.4f);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_FLOAT_EQ(out[0].score, 0.9f);
    EXPECT_FLOAT_EQ(out[1].score, 0.85f);
}

TEST(NMS, EqualScoresKeepInputOrder) {
    std::vector<enroll::algo::Detection> dets = {box(0, 0, 10, 10, 0.5f), box(100, 0, 10, 10, 0.5f)};

    auto out = enroll::algo::nms_boxes(dets, 0.4f);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_FLOAT_EQ(out[0].box.x, 0.0f);
    EXPECT_FLOAT_EQ(out[1].box.x, 100.0f);
}

TEST(Geometry, IoUAndNormalization) {
    EXPECT_FLOAT_EQ(enroll::algo::box_iou(cv::Rect2f(0, 0, 10, 10), cv::Rect2f(0, 0, 10, 10)), 1.0f);
    EXPECT_FLOAT_EQ(enroll::algo::box_iou(cv::Rect2f(0, 0, 10, 10), cv::Rect2f(20, 20, 5, 5)), 0.0f);

    auto c = enroll::algo::clamp_box(cv::Rect2f(-5, 90, 20, 20), 100, 100);
    EXPECT_FLOAT_EQ(c.x, 0.0f);
    EXPECT_FLOAT_EQ(c.width, 15.0f);
    EXPECT_FLOAT_EQ(c.height, 10.0f);

    auto n = enroll::algo::to_normalized(cv::Rect2f(200, 250, 400, 500), 800, 1000);
    EXPECT_DOUBLE_EQ(n.x, 0.25);
    EXPECT_DOUBLE_EQ(n.y, 0.25);
    EXPECT_DOUBLE_EQ(n.width, 0.5);
    EXPECT_DOUBLE_EQ(n.height, 0.5);

    auto px = enroll::algo::to_pixels(n, 800, 1000);
    EXPECT_EQ(px, cv::Rect(200, 250, 400, 500));

    // boxes leaving the image are clipped before normalizing
    auto edge = enroll::algo::to_normalized(cv::Rect2f(600, -250, 400, 500), 800, 1000);
    EXPECT_DOUBLE_EQ(edge.x, 0.75);
    EXPECT_DOUBLE_EQ(edge.y, 0.0);
    EXPECT_DOUBLE_EQ(edge.width, 0.25);
    EXPECT_DOUBLE_EQ(edge.height, 0.25);
}
