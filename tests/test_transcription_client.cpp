#include "voice/transcription_client.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <future>

using namespace test_utils;
using Outcome = Voice::TranscriptResult::Outcome;
using Voice::VoiceError;

// ============================================================
// Wire format
// ============================================================
TEST(RecognitionRequestTest, CarriesConfigAndBase64Audio) {
    Voice::PcmBuffer pcm = {0x00, 0xFF, 0x10, 0x80, 0x7F};
    auto j = Voice::buildRecognitionRequest(pcm, 16000, "en-US");

    EXPECT_EQ(j["config"]["encoding"], "LINEAR16");
    EXPECT_EQ(j["config"]["sampleRateHertz"], 16000);
    EXPECT_EQ(j["config"]["languageCode"], "en-US");
    EXPECT_EQ(j["config"]["enableAutomaticPunctuation"], true);
    EXPECT_EQ(j["audio"]["content"], "AP8QgH8=");
}

TEST(RecognitionResponseTest, TakesFirstAlternativeOfFirstResult) {
    auto r = Voice::parseRecognitionResponse(FakeHttpTransport::ok(
        R"({"results":[{"alternatives":[{"transcript":"add milk","confidence":0.93},
                                        {"transcript":"add silk"}]},
                       {"alternatives":[{"transcript":"ignored"}]}]})"));
    EXPECT_EQ(r.outcome, Outcome::Ready);
    EXPECT_EQ(r.text, "add milk");
}

TEST(RecognitionResponseTest, MissingOrEmptyResultsMeansNoSpeech) {
    EXPECT_EQ(Voice::parseRecognitionResponse(FakeHttpTransport::ok("{}")).outcome, Outcome::NoSpeech);
    EXPECT_EQ(Voice::parseRecognitionResponse(FakeHttpTransport::ok(R"({"results":[]})")).outcome,
              Outcome::NoSpeech);
    EXPECT_EQ(Voice::parseRecognitionResponse(
                  FakeHttpTransport::ok(R"({"results":[{"alternatives":[{"transcript":"  "}]}]})"))
                  .outcome,
              Outcome::NoSpeech);
}

TEST(RecognitionResponseTest, HttpErrorIsServiceErrorWithStatus) {
    auto r = Voice::parseRecognitionResponse(FakeHttpTransport::status(500, "oops"));
    EXPECT_EQ(r.outcome, Outcome::Failed);
    EXPECT_EQ(r.reason, VoiceError::ServiceError);
    EXPECT_EQ(r.serviceCode, 500);
}

TEST(RecognitionResponseTest, MalformedBodyIsParseFailure) {
    auto check = [](const std::string& body) {
        auto r = Voice::parseRecognitionResponse(FakeHttpTransport::ok(body));
        EXPECT_EQ(r.outcome, Outcome::Failed) << body;
        EXPECT_EQ(r.reason, VoiceError::ParseFailure) << body;
    };
    check("<html>not json</html>");
    check("[1,2,3]");
    check(R"({"results":"nope"})");
    check(R"({"results":[{}]})");
    check(R"({"results":[{"alternatives":[]}]})");
    check(R"({"results":[{"alternatives":[{"transcript":42}]}]})");
}

TEST(RecognitionResponseTest, UnreachableHostIsNetworkFailure) {
    auto r = Voice::parseRecognitionResponse(FakeHttpTransport::unreachable());
    EXPECT_EQ(r.outcome, Outcome::Failed);
    EXPECT_EQ(r.reason, VoiceError::NetworkFailure);
}

// ============================================================
// Client
// ============================================================
class TranscriptionClientTest : public ::testing::Test {
protected:
    void TearDown() override {
        http->release();
        network.shutdown();
        loop.shutdown();
    }

    struct Delivery {
        Voice::SessionId session = 0;
        Voice::TranscriptResult result;
        bool onLoop = false;
    };

    Delivery transcribeAndWait(Voice::SessionId id, Voice::PcmBuffer pcm) {
        std::promise<Delivery> done;
        auto fut = done.get_future();
        client.transcribe(id, std::move(pcm), 16000, "en-US",
                          [&](Voice::SessionId s, Voice::TranscriptResult r) {
                              done.set_value({s, std::move(r), loop.isLoopThread()});
                          });
        if (fut.wait_for(std::chrono::seconds(3)) != std::future_status::ready) {
            ADD_FAILURE() << "callback never delivered";
            return {};
        }
        return fut.get();
    }

    std::shared_ptr<FakeHttpTransport> http = std::make_shared<FakeHttpTransport>();
    Voice::EventLoop loop{"loop"};
    Voice::WorkerPool network{"network", 2};
    Voice::TranscriptionClient client{http, network, loop, "https://speech.test/v1/speech:recognize"};
};

TEST_F(TranscriptionClientTest, DeliversTranscriptOnLoopThread) {
    http->respondWith(FakeHttpTransport::ok(
        R"({"results":[{"alternatives":[{"transcript":"add milk"}]}]})"));

    Voice::PcmBuffer pcm(64000, 0x11);
    auto d = transcribeAndWait(7, pcm);

    EXPECT_EQ(d.session, 7u);
    EXPECT_EQ(d.result.outcome, Outcome::Ready);
    EXPECT_EQ(d.result.text, "add milk");
    EXPECT_TRUE(d.onLoop);

    auto reqs = http->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].url, "https://speech.test/v1/speech:recognize");

    auto sent = nlohmann::json::parse(reqs[0].body);
    EXPECT_EQ(sent["config"]["sampleRateHertz"], 16000);
    EXPECT_EQ(sent["audio"]["content"].get<std::string>().size(), 64000u / 3 * 4 + 4);
}

TEST_F(TranscriptionClientTest, EmptyResultsArriveAsNoSpeech) {
    http->respondWith(FakeHttpTransport::ok(R"({"results":[]})"));
    auto d = transcribeAndWait(1, Voice::PcmBuffer(3200, 0));
    EXPECT_EQ(d.result.outcome, Outcome::NoSpeech);
}

TEST_F(TranscriptionClientTest, ServerErrorArrivesAsServiceError) {
    http->respondWith(FakeHttpTransport::status(500));
    auto d = transcribeAndWait(2, Voice::PcmBuffer(3200, 0));
    EXPECT_EQ(d.result.reason, VoiceError::ServiceError);
    EXPECT_EQ(d.result.serviceCode, 500);
}

TEST_F(TranscriptionClientTest, UnreachableServiceArrivesAsNetworkFailure) {
    http->respondWith(FakeHttpTransport::unreachable());
    auto d = transcribeAndWait(3, Voice::PcmBuffer(3200, 0));
    EXPECT_EQ(d.result.reason, VoiceError::NetworkFailure);
    EXPECT_TRUE(d.onLoop);
}

TEST_F(TranscriptionClientTest, ClosedPoolStillDeliversNetworkFailure) {
    network.shutdown();

    std::promise<Voice::TranscriptResult> done;
    auto fut = done.get_future();
    EXPECT_FALSE(client.transcribe(4, Voice::PcmBuffer(3200, 0), 16000, "en-US",
                                   [&done](Voice::SessionId, Voice::TranscriptResult r) {
                                       done.set_value(std::move(r));
                                   }));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(fut.get().reason, VoiceError::NetworkFailure);
    EXPECT_EQ(http->requestCount(), 0u);
}
