#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "model_service.h"

#include <memory>
#include <stdexcept>

namespace {

class NullClient final : public enroll::DetectionClient {
  public:
    void detect(const enroll::Image&, enroll::DetectCallback done) override {
        done(enroll::Result<enroll::DetectionResult>::Err(enroll::Status::Unsupported("null client")));
    }
    void embed(const enroll::Image&, enroll::EmbedCallback done) override {
        done(enroll::Result<enroll::EmbedResult>::Err(enroll::Status::Unsupported("null client")));
    }
};

static enroll::Result<std::unique_ptr<enroll::DetectionClient>> make_client() {
    return enroll::Result<std::unique_ptr<enroll::DetectionClient>>::Ok(std::make_unique<NullClient>());
}

} // namespace

TEST(ModelService, StartsUninitialized) {
    enroll::ModelService svc;
    EXPECT_EQ(svc.state(), enroll::ModelState::Uninitialized);
    EXPECT_FALSE(svc.ready());
    EXPECT_EQ(svc.client(), nullptr);
}

TEST(ModelService, InitializeOnceThenNoOp) {
    enroll::ModelService svc;
    int calls = 0;
    auto factory = [&] {
        ++calls;
        return make_client();
    };

    ASSERT_TRUE(svc.initialize(factory).ok());
    EXPECT_EQ(svc.state(), enroll::ModelState::Ready);
    enroll::DetectionClient* first = svc.client();
    ASSERT_NE(first, nullptr);

    ASSERT_TRUE(svc.initialize(factory).ok());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(svc.client(), first);
}

TEST(ModelService, FactoryErrorMeansFailedAndRetryable) {
    enroll::ModelService svc;
    auto st = svc.initialize([] {
        return enroll::Result<std::unique_ptr<enroll::DetectionClient>>::Err(enroll::Status::NotFound("scrfd.onnx"));
    });
    EXPECT_EQ(st.code, enroll::Status::Code::NotFound);
    EXPECT_EQ(svc.state(), enroll::ModelState::Failed);
    EXPECT_EQ(svc.client(), nullptr);
    EXPECT_EQ(svc.last_status().message, "scrfd.onnx");

    ASSERT_TRUE(svc.initialize(make_client).ok());
    EXPECT_TRUE(svc.ready());
}

TEST(ModelService, ThrowingFactoryIsContained) {
    enroll::ModelService svc;
    auto st = svc.initialize([]() -> enroll::Result<std::unique_ptr<enroll::DetectionClient>> {
        throw std::runtime_error("session create failed");
    });
    EXPECT_EQ(st.code, enroll::Status::Code::Internal);
    EXPECT_EQ(svc.state(), enroll::ModelState::Failed);
}

TEST(ModelService, NullClientOrEmptyFactoryFails) {
    enroll::ModelService svc;
    auto st = svc.initialize([] {
        return enroll::Result<std::unique_ptr<enroll::DetectionClient>>::Ok(std::unique_ptr<enroll::DetectionClient>{});
    });
    EXPECT_FALSE(st.ok());
    EXPECT_EQ(svc.state(), enroll::ModelState::Failed);

    EXPECT_FALSE(svc.initialize(enroll::ModelService::Factory{}).ok());
    EXPECT_EQ(svc.state(), enroll::ModelState::Failed);
}

TEST(ModelService, ShutdownDropsClient) {
    enroll::ModelService svc;
    ASSERT_TRUE(svc.initialize(make_client).ok());
    svc.shutdown();
    EXPECT_EQ(svc.state(), enroll::ModelState::Uninitialized);
    EXPECT_EQ(svc.client(), nullptr);
    EXPECT_STREQ(enroll::to_string(svc.state()), "uninitialized");
}
