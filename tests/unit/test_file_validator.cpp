#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "validators.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace {

static enroll::RawImageInput input_of(std::size_t bytes, const std::string& media_type) {
    enroll::RawImageInput in;
    in.byte_length = bytes;
    in.media_type = media_type;
    return in;
}

} // namespace

TEST(FileValidator, AcceptsImageAtExactLimit) {
    enroll::PipelineConfig cfg;
    enroll::FileValidator v(cfg);

    auto e = v.validate(input_of(enroll::kMaxFileSize, "image/jpeg"));
    EXPECT_TRUE(e.ok());
}

TEST(FileValidator, RejectsOneByteOverLimit) {
    enroll::PipelineConfig cfg;
    enroll::FileValidator v(cfg);

    auto e = v.validate(input_of(enroll::kMaxFileSize + 1, "image/png"));
    ASSERT_EQ(e.kind, enroll::ErrorKind::FileTooLarge);
    EXPECT_EQ(e.actual_bytes, enroll::kMaxFileSize + 1);
    EXPECT_EQ(e.max_bytes, enroll::kMaxFileSize);
}

TEST(FileValidator, SizeIsCheckedBeforeType) {
    enroll::PipelineConfig cfg;
    enroll::FileValidator v(cfg);

    auto e = v.validate(input_of(6u * 1024u * 1024u, "application/pdf"));
    EXPECT_EQ(e.kind, enroll::ErrorKind::FileTooLarge);
}

TEST(FileValidator, MediaTypePrefixIsCaseInsensitive) {
    enroll::PipelineConfig cfg;
    enroll::FileValidator v(cfg);

    EXPECT_TRUE(v.validate(input_of(10, "IMAGE/JPEG")).ok());
    EXPECT_TRUE(v.validate(input_of(10, "Image/webp")).ok());
}

TEST(FileValidator, RejectsNonImageTypes) {
    enroll::PipelineConfig cfg;
    enroll::FileValidator v(cfg);

    for (const char* mt : {"application/pdf", "text/plain", "", "imag", "video/mp4", " image/png"}) {
        auto e = v.validate(input_of(10, mt));
        EXPECT_EQ(e.kind, enroll::ErrorKind::InvalidFileType) << "media type: '" << mt << "'";
    }
}

TEST(FileValidator, HonoursConfiguredLimit) {
    enroll::PipelineConfig cfg;
    cfg.max_file_size = 100;
    enroll::FileValidator v(cfg);

    EXPECT_TRUE(v.validate(input_of(100, "image/gif")).ok());
    EXPECT_EQ(v.validate(input_of(101, "image/gif")).kind, enroll::ErrorKind::FileTooLarge);
}

TEST(FileValidator, PayloadLargerThanDeclaredLengthIsTooLarge) {
    enroll::PipelineConfig cfg;
    cfg.max_file_size = 100;
    enroll::FileValidator v(cfg);

    auto in = enroll::RawImageInput::from_bytes(std::vector<std::uint8_t>(150, 0xFF), "image/jpeg");
    in.byte_length = 10;
    auto e = v.validate(in);
    ASSERT_EQ(e.kind, enroll::ErrorKind::FileTooLarge);
    EXPECT_EQ(e.actual_bytes, 150u);
}

TEST(FileValidator, DeclaredLengthCountsEvenWithSmallPayload) {
    enroll::PipelineConfig cfg;
    cfg.max_file_size = 100;
    enroll::FileValidator v(cfg);

    auto in = enroll::RawImageInput::from_bytes(std::vector<std::uint8_t>(10, 0xFF), "image/jpeg");
    EXPECT_TRUE(v.validate(in).ok());
    in.byte_length = 101;
    EXPECT_EQ(v.validate(in).kind, enroll::ErrorKind::FileTooLarge);
}
