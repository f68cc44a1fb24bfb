#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "media_type.h"

#include <cstdint>
#include <string>
#include <vector>

namespace {

static std::string sniff(const std::vector<std::uint8_t>& b) {
    return enroll::sniff_media_type(b.data(), b.size());
}

} // namespace

TEST(MediaType, KnownSignatures) {
    EXPECT_EQ(sniff({0xFF, 0xD8, 0xFF, 0xE0, 0x00}), "image/jpeg");
    EXPECT_EQ(sniff({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00}), "image/png");
    EXPECT_EQ(sniff({'G', 'I', 'F', '8', '9', 'a'}), "image/gif");
    EXPECT_EQ(sniff({'G', 'I', 'F', '8', '7', 'a'}), "image/gif");
    EXPECT_EQ(sniff({'B', 'M', 0x36, 0x00}), "image/bmp");
    EXPECT_EQ(sniff({'R', 'I', 'F', 'F', 0x10, 0x00, 0x00, 0x00, 'W', 'E', 'B', 'P'}), "image/webp");
}

TEST(MediaType, UnknownOrTruncated) {
    EXPECT_EQ(sniff({}), "application/octet-stream");
    EXPECT_EQ(sniff({0xFF, 0xD8}), "application/octet-stream");
    EXPECT_EQ(sniff({'%', 'P', 'D', 'F', '-'}), "application/octet-stream");
    EXPECT_EQ(sniff({'R', 'I', 'F', 'F', 0x10, 0x00, 0x00, 0x00, 'W', 'A', 'V', 'E'}), "application/octet-stream");
    EXPECT_EQ(enroll::sniff_media_type(nullptr, 16), "application/octet-stream");
}
