#if defined(__has_include) && __has_include(<gtest/gtest.h>)
    #include <gtest/gtest.h>
#elif defined(__has_include) && __has_include(<gtest.h>)
    #include <gtest.h>
#else
    #error "[ERROR] 'gtest.h' header not found"
#endif

#include "embedding.h"
#include "orchestrator.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

// Decoder whose completions are delivered by the test. Every decoded buffer counts its own release.
class ManualDecoder final : public enroll::ImageDecoder {
  public:
    void decode(std::shared_ptr<const std::vector<std::uint8_t>> bytes, enroll::DecodeCallback done) override {
        ++calls;
        if (throw_on_decode) throw 7;
        last_bytes = std::move(bytes);
        pending.push_back(std::move(done));
    }

    void resolve(std::size_t i, int w, int h) {
        const std::size_t n = static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3u;
        auto* px = new std::uint8_t[n];
        for (std::size_t k = 0; k < n; ++k)
            px[k] = static_cast<std::uint8_t>(k % 251u);

        std::shared_ptr<int> counter = released;
        auto img = enroll::Image::adopt(enroll::PixelFormat::BGR_U8, w, h, px, static_cast<std::size_t>(w) * 3u,
                                        [counter](void* p) {
                                            delete[] static_cast<std::uint8_t*>(p);
                                            ++*counter;
                                        });
        take_(i)(enroll::Result<enroll::Image>::Ok(std::move(img)));
    }

    void fail(std::size_t i, enroll::Status st) {
        take_(i)(enroll::Result<enroll::Image>::Err(std::move(st)));
    }

    int calls = 0;
    bool throw_on_decode = false;
    std::shared_ptr<const std::vector<std::uint8_t>> last_bytes;
    std::vector<enroll::DecodeCallback> pending;
    std::shared_ptr<int> released = std::make_shared<int>(0);

  private:
    enroll::DecodeCallback take_(std::size_t i) {
        enroll::DecodeCallback cb = std::move(pending.at(i));
        pending.at(i) = nullptr;
        return cb;
    }
};

// Detection client that parks callbacks until the test answers them.
class ManualClient final : public enroll::DetectionClient {
  public:
    void detect(const enroll::Image& image, enroll::DetectCallback done) override {
        detect_dims.push_back({image.width(), image.height()});
        detects.push_back(std::move(done));
    }
    void embed(const enroll::Image& image, enroll::EmbedCallback done) override {
        embed_dims.push_back({image.width(), image.height()});
        embeds.push_back(std::move(done));
    }

    void answer_detect(std::size_t i, enroll::Result<enroll::DetectionResult> r) {
        auto cb = std::move(detects.at(i));
        detects.at(i) = nullptr;
        cb(std::move(r));
    }
    void answer_embed(std::size_t i, enroll::Result<enroll::EmbedResult> r) {
        auto cb = std::move(embeds.at(i));
        embeds.at(i) = nullptr;
        cb(std::move(r));
    }

    std::vector<enroll::DetectCallback> detects;
    std::vector<enroll::EmbedCallback> embeds;
    std::vector<enroll::ImageDimensions> detect_dims;
    std::vector<enroll::ImageDimensions> embed_dims;
};

static enroll::Result<enroll::DetectionResult> one_good_face() {
    enroll::DetectionResult d;
    d.face_count = 1;
    d.bbox = enroll::BoundingBox{0.3, 0.2, 0.4, 0.5};
    d.confidence = 0.95;
    d.quality.overall = enroll::QualityLevel::Good;
    return enroll::Result<enroll::DetectionResult>::Ok(d);
}

static enroll::Result<enroll::EmbedResult> unit_embedding(int dim = enroll::kEmbeddingDim) {
    enroll::EmbedResult e;
    e.embedding.resize(static_cast<std::size_t>(dim));
    for (int i = 0; i < dim; ++i)
        e.embedding[static_cast<std::size_t>(i)] = static_cast<float>((i % 7) + 1);
    enroll::l2_normalize(e.embedding);
    e.quality.overall = enroll::QualityLevel::Excellent;
    return enroll::Result<enroll::EmbedResult>::Ok(std::move(e));
}

static enroll::RawImageInput jpeg_input() {
    return enroll::RawImageInput::from_bytes({0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10}, "image/jpeg");
}

class OrchestratorTest : public ::testing::Test {
  protected:
    void SetUp() override {
        auto st = models.initialize([this] {
            auto c = std::make_unique<ManualClient>();
            client = c.get();
            return enroll::Result<std::unique_ptr<enroll::DetectionClient>>::Ok(std::move(c));
        });
        ASSERT_TRUE(st.ok()) << st.message;
    }

    void make(enroll::PipelineConfig cfg = {}) {
        enroll::HostCallbacks host;
        host.on_state_changed = [this](const enroll::ScanSnapshot& s) {
            stages.push_back(s.stage);
            overall.push_back(s.progress.overall);
            if (on_state) on_state(s);
        };
        host.on_photo_accepted = [this](const enroll::ScanResult& r) { accepted.push_back(r); };
        host.on_photo_rejected = [this](enroll::ErrorKind k, const std::string& msg) {
            rejected.emplace_back(k, msg);
            if (on_rejected) on_rejected(k);
        };

        auto r = enroll::ScanOrchestrator::create(std::move(cfg), models, decoder, std::move(host));
        ASSERT_TRUE(r.ok()) << r.status().message;
        orch = std::move(r).value();
    }

    // select -> decode -> detect -> crop, leaving the embed call parked
    void run_to_embed() {
        orch->select_file(jpeg_input());
        decoder.resolve(decoder.pending.size() - 1, 700, 900);
        client->answer_detect(client->detects.size() - 1, one_good_face());
    }

    enroll::ModelService models;
    ManualClient* client = nullptr;
    ManualDecoder decoder;
    std::unique_ptr<enroll::ScanOrchestrator> orch;

    std::vector<enroll::ScanStage> stages;
    std::vector<int> overall;
    std::vector<enroll::ScanResult> accepted;
    std::vector<std::pair<enroll::ErrorKind, std::string>> rejected;
    std::function<void(const enroll::ScanSnapshot&)> on_state;
    std::function<void(enroll::ErrorKind)> on_rejected;
};

} // namespace

TEST_F(OrchestratorTest, AcceptsGoodPhotoEndToEnd) {
    make();
    orch->select_file(jpeg_input());
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Validating);
    EXPECT_EQ(orch->snapshot().progress.overall, 10);
    ASSERT_EQ(decoder.calls, 1);

    decoder.resolve(0, 700, 900);
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Detecting);
    EXPECT_EQ(orch->snapshot().progress.detection, 30);
    ASSERT_TRUE(orch->snapshot().dims.has_value());
    EXPECT_EQ(orch->snapshot().dims->width, 700);
    ASSERT_EQ(client->detects.size(), 1u);
    EXPECT_EQ(client->detect_dims[0].height, 900);

    client->answer_detect(0, one_good_face());
    EXPECT_EQ(orch->stage(), enroll::ScanStage::ReEmbedding);
    EXPECT_EQ(orch->snapshot().progress.detection, 100);
    EXPECT_EQ(orch->snapshot().progress.quality, 100);
    EXPECT_EQ(orch->snapshot().progress.embedding, 30);
    ASSERT_TRUE(orch->snapshot().bbox.has_value());
    // decoded bitmap is gone once the crop exists
    EXPECT_EQ(*decoder.released, 1);
    EXPECT_TRUE(orch->holds_pixels());
    ASSERT_EQ(client->embeds.size(), 1u);
    EXPECT_EQ(client->embed_dims[0].width, 400);
    EXPECT_EQ(client->embed_dims[0].height, 514);

    client->answer_embed(0, unit_embedding());
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Complete);
    EXPECT_EQ(orch->snapshot().progress.overall, 100);
    EXPECT_FALSE(orch->holds_pixels());
    EXPECT_TRUE(rejected.empty());

    ASSERT_EQ(accepted.size(), 1u);
    const auto& res = accepted[0];
    EXPECT_EQ(res.crop_width, 400);
    EXPECT_EQ(res.crop_height, 514);
    ASSERT_GE(res.crop_jpeg.size(), 2u);
    EXPECT_EQ(res.crop_jpeg[0], 0xFF);
    EXPECT_EQ(res.crop_jpeg[1], 0xD8);
    EXPECT_EQ(res.embedding.size(), 128u);
    EXPECT_NEAR(res.region.x, 154.0, 1e-6);
    EXPECT_NEAR(res.region.height, 504.0, 1e-6);
    EXPECT_EQ(res.crop_quality.overall, enroll::QualityLevel::Excellent);
    ASSERT_TRUE(orch->result().has_value());

    const std::vector<enroll::ScanStage> expected = {enroll::ScanStage::Validating,      enroll::ScanStage::Validating,
                                                     enroll::ScanStage::Detecting,       enroll::ScanStage::QualityChecking,
                                                     enroll::ScanStage::Cropping,        enroll::ScanStage::ReEmbedding,
                                                     enroll::ScanStage::Complete};
    EXPECT_EQ(stages, expected);
    for (std::size_t i = 1; i < overall.size(); ++i)
        EXPECT_GE(overall[i], overall[i - 1]);
}

TEST_F(OrchestratorTest, OversizedFileIsNeverDecoded) {
    make();
    auto in = jpeg_input();
    in.byte_length = 6u * 1024u * 1024u;
    orch->select_file(std::move(in));

    EXPECT_EQ(decoder.calls, 0);
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Error);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::FileTooLarge);
    EXPECT_EQ(rejected[0].second, "File too large. Maximum size is 5MB, got 6.0MB");
    ASSERT_TRUE(orch->snapshot().error.has_value());
    EXPECT_EQ(orch->snapshot().progress.detection, 100);
}

TEST_F(OrchestratorTest, UnderstatedLengthStillHitsSizeLimit) {
    make();
    auto in = enroll::RawImageInput::from_bytes(std::vector<std::uint8_t>(6u * 1024u * 1024u, 0xFF), "image/jpeg");
    in.byte_length = 1024;
    orch->select_file(std::move(in));

    EXPECT_EQ(decoder.calls, 0);
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Error);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::FileTooLarge);
    EXPECT_EQ(rejected[0].second, "File too large. Maximum size is 5MB, got 6.0MB");
}

TEST_F(OrchestratorTest, NonImageTypeIsRejected) {
    make();
    orch->select_file(enroll::RawImageInput::from_bytes({'%', 'P', 'D', 'F'}, "application/pdf"));

    EXPECT_EQ(decoder.calls, 0);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::InvalidFileType);
}

TEST_F(OrchestratorTest, MissingPayloadIsProcessingError) {
    make();
    enroll::RawImageInput in;
    in.byte_length = 10;
    in.media_type = "image/png";
    orch->select_file(std::move(in));

    EXPECT_EQ(decoder.calls, 0);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::ProcessingException);
}

TEST_F(OrchestratorTest, MultipleFacesStopBeforeCropping) {
    make();
    orch->select_file(jpeg_input());
    decoder.resolve(0, 700, 900);

    auto two = one_good_face();
    two.value().face_count = 2;
    client->answer_detect(0, std::move(two));

    EXPECT_EQ(orch->stage(), enroll::ScanStage::Error);
    EXPECT_TRUE(client->embeds.empty());
    EXPECT_TRUE(accepted.empty());
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::MultipleFacesDetected);
    EXPECT_EQ(orch->snapshot().progress.quality, 100);
    EXPECT_EQ(*decoder.released, 1);
    EXPECT_FALSE(orch->holds_pixels());
}

TEST_F(OrchestratorTest, DetectFailureIsProcessingError) {
    make();
    orch->select_file(jpeg_input());
    decoder.resolve(0, 700, 900);
    client->answer_detect(0, enroll::Result<enroll::DetectionResult>::Err(enroll::Status::Internal("backend down")));

    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::ProcessingException);
    EXPECT_EQ(rejected[0].second, "Failed to process image. Please try again.");
    EXPECT_EQ(orch->snapshot().error->detail, "backend down");
    EXPECT_EQ(orch->snapshot().progress.detection, 100);
}

TEST_F(OrchestratorTest, DecodeFailureIsProcessingError) {
    make();
    orch->select_file(jpeg_input());
    decoder.fail(0, enroll::Status::DecodeError("decode_image: truncated"));

    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::ProcessingException);
    EXPECT_TRUE(client->detects.empty());
}

TEST_F(OrchestratorTest, MalformedEmbeddingIsProcessingError) {
    make();
    run_to_embed();
    client->answer_embed(0, unit_embedding(512));

    EXPECT_TRUE(accepted.empty());
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::ProcessingException);
    EXPECT_EQ(orch->snapshot().progress.embedding, 100);
    EXPECT_FALSE(orch->holds_pixels());
}

TEST_F(OrchestratorTest, NewFileSupersedesEmbedInFlight) {
    make();
    run_to_embed();
    const auto first = orch->generation();

    orch->select_file(jpeg_input());
    EXPECT_GT(orch->generation(), first);
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Validating);

    // the first generation's embedding arrives late and is dropped
    client->answer_embed(0, unit_embedding());
    EXPECT_TRUE(accepted.empty());
    EXPECT_TRUE(rejected.empty());
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Validating);

    decoder.resolve(1, 700, 900);
    client->answer_detect(1, one_good_face());
    client->answer_embed(1, unit_embedding());
    EXPECT_EQ(accepted.size(), 1u);
    EXPECT_EQ(*decoder.released, 2);
}

TEST_F(OrchestratorTest, StaleDecodeIsReleasedAndIgnored) {
    make();
    orch->select_file(jpeg_input());
    orch->select_file(jpeg_input());
    ASSERT_EQ(decoder.calls, 2);

    decoder.resolve(0, 700, 900);
    EXPECT_TRUE(client->detects.empty());
    EXPECT_EQ(*decoder.released, 1);
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Validating);

    decoder.resolve(1, 700, 900);
    EXPECT_EQ(client->detects.size(), 1u);
}

TEST_F(OrchestratorTest, ResetAbandonsGeneration) {
    make();
    orch->select_file(jpeg_input());
    decoder.resolve(0, 700, 900);
    ASSERT_EQ(client->detects.size(), 1u);

    orch->reset();
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Idle);
    EXPECT_EQ(*decoder.released, 1);
    EXPECT_FALSE(orch->holds_pixels());

    client->answer_detect(0, one_good_face());
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Idle);
    EXPECT_TRUE(client->embeds.empty());
    EXPECT_TRUE(rejected.empty());
}

TEST_F(OrchestratorTest, DestructionVoidsPendingCallbacks) {
    make();
    orch->select_file(jpeg_input());
    decoder.resolve(0, 700, 900);
    ASSERT_EQ(client->detects.size(), 1u);
    const std::size_t notified = stages.size();

    orch.reset();
    EXPECT_EQ(*decoder.released, 1);

    client->answer_detect(0, one_good_face());
    EXPECT_EQ(stages.size(), notified);
    EXPECT_TRUE(accepted.empty());
    EXPECT_TRUE(rejected.empty());
}

TEST_F(OrchestratorTest, HostMayDestroyFromStateCallback) {
    make();
    on_state = [this](const enroll::ScanSnapshot& s) {
        if (s.stage == enroll::ScanStage::Detecting) orch.reset();
    };
    orch->select_file(jpeg_input());
    decoder.resolve(0, 700, 900);

    EXPECT_TRUE(orch == nullptr);
    EXPECT_TRUE(client->detects.empty());
    EXPECT_EQ(*decoder.released, 1);
}

TEST_F(OrchestratorTest, RejectedCallbackMaySelectAgain) {
    make();
    bool retried = false;
    on_rejected = [&](enroll::ErrorKind) {
        if (retried) return;
        retried = true;
        orch->select_file(jpeg_input());
    };

    orch->select_file(enroll::RawImageInput::from_bytes({0x00}, "text/plain"));
    EXPECT_TRUE(retried);
    EXPECT_EQ(decoder.calls, 1);
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Validating);
    EXPECT_FALSE(orch->snapshot().error.has_value());
}

TEST_F(OrchestratorTest, ModelsNotReadyFailsBeforeDecode) {
    models.shutdown();
    make();
    orch->select_file(jpeg_input());

    EXPECT_EQ(decoder.calls, 0);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::ProcessingException);
    EXPECT_NE(orch->snapshot().error->detail.find("models not ready"), std::string::npos);
}

TEST_F(OrchestratorTest, AspectMismatchIsCroppedByDefault) {
    make();
    orch->select_file(jpeg_input());
    decoder.resolve(0, 1000, 1000);

    EXPECT_EQ(orch->stage(), enroll::ScanStage::Detecting);
    EXPECT_EQ(client->detects.size(), 1u);
}

TEST_F(OrchestratorTest, AspectMismatchRejectedWhenConfigured) {
    enroll::PipelineConfig cfg;
    cfg.aspect_policy = enroll::AspectPolicy::RejectMismatch;
    make(cfg);
    orch->select_file(jpeg_input());
    decoder.resolve(0, 1000, 1000);

    EXPECT_TRUE(client->detects.empty());
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::AspectRatioMismatch);
    EXPECT_EQ(*decoder.released, 1);
}

TEST_F(OrchestratorTest, NonStandardThrowFromStateCallbackIsContained) {
    make();
    on_state = [](const enroll::ScanSnapshot&) { throw 42; };

    orch->select_file(jpeg_input());
    decoder.resolve(0, 700, 900);
    client->answer_detect(0, one_good_face());
    client->answer_embed(0, unit_embedding());

    EXPECT_EQ(orch->stage(), enroll::ScanStage::Complete);
    EXPECT_EQ(accepted.size(), 1u);
    EXPECT_TRUE(rejected.empty());
}

TEST_F(OrchestratorTest, NonStandardThrowFromRejectCallbackIsContained) {
    make();
    on_state = [](const enroll::ScanSnapshot&) { throw std::string("state"); };
    on_rejected = [](enroll::ErrorKind) { throw 42; };

    orch->select_file(enroll::RawImageInput::from_bytes({0x00}, "text/plain"));
    EXPECT_EQ(orch->stage(), enroll::ScanStage::Error);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::InvalidFileType);

    orch->select_file(jpeg_input());
    EXPECT_EQ(decoder.calls, 1);
}

TEST_F(OrchestratorTest, NonStandardThrowFromDecoderIsProcessingError) {
    make();
    decoder.throw_on_decode = true;
    orch->select_file(jpeg_input());

    EXPECT_EQ(orch->stage(), enroll::ScanStage::Error);
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, enroll::ErrorKind::ProcessingException);
    EXPECT_NE(orch->snapshot().error->detail.find("non-standard exception"), std::string::npos);
}

TEST(Orchestrator, CreateRejectsBadConfig) {
    enroll::ModelService models;
    ManualDecoder decoder;
    enroll::PipelineConfig cfg;
    cfg.jpeg_quality = 0;

    auto r = enroll::ScanOrchestrator::create(cfg, models, decoder);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.status().code, enroll::Status::Code::InvalidArgument);
}
