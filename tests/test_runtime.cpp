#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "commands/commands_core.hpp"
#include "error_manager.hpp"
#include "voice/base64.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace test_utils;
using Voice::SessionState;

class RuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::use(bootstrap_config::defaultErrors());

        auto cfg = bootstrap_config::voiceConfigFromJson(bootstrap_config::defaultVoiceConfig());
        cfg.chatBackendUrl = "https://backend.test/ask";

        rt = buildRuntime(cfg, captureFactory(mic), playbackFactory(speaker), speech, backend);
        rt->session->addNoticeListener([this](const Voice::Notice& n) { notices.add(n.code); });
        rt->replies->addNoticeListener([this](const Voice::Notice& n) { notices.add(n.code); });
    }

    void TearDown() override {
        g_runtime = nullptr;
        speech->release();
        backend->release();
        speaker->release();
        rt.reset();
    }

    std::shared_ptr<CaptureScript> mic = std::make_shared<CaptureScript>();
    std::shared_ptr<PlaybackScript> speaker = std::make_shared<PlaybackScript>();
    std::shared_ptr<FakeHttpTransport> speech = std::make_shared<FakeHttpTransport>();
    std::shared_ptr<FakeHttpTransport> backend = std::make_shared<FakeHttpTransport>();
    std::unique_ptr<Runtime> rt;
    NoticeLog notices;
};

TEST_F(RuntimeTest, SpokenQuestionIsAnsweredAndReadBack) {
    Voice::PcmBuffer answerAudio(2205 * 2, 0x10);
    speech->respondWith(FakeHttpTransport::ok(
        R"({"results":[{"alternatives":[{"transcript":"how much did I spend on groceries"}]}]})"));
    speech->respondWith(FakeHttpTransport::ok(
        nlohmann::json{{"audioContent", Base64::encode(answerAudio)}}.dump()));
    backend->respondWith(FakeHttpTransport::ok(
        R"({"answer":"You spent 42.10 EUR on groceries.","wallet_link":"https://pay.test/p/9"})"));

    mic->budget = 16000;
    rt->session->requestToggle();
    ASSERT_TRUE(waitFor([&] { return mic->delivered.load() == 16000; }));
    rt->session->requestToggle();

    ASSERT_TRUE(waitFor([&] { return rt->chat->latestAssistantMessage().has_value(); }));
    EXPECT_EQ(*rt->chat->latestAssistantMessage(), "You spent 42.10 EUR on groceries.");
    EXPECT_EQ(nlohmann::json::parse(backend->requests().at(0).body)["question"],
              "how much did I spend on groceries");
    EXPECT_EQ(rt->session->state(), SessionState::Idle);

    rt->replies->speakLatestReply();
    ASSERT_TRUE(waitFor([&] { return notices.contains("tts_finished"); }));
    EXPECT_EQ(speaker->lastRate.load(), 22050u);
    EXPECT_EQ(rt->playback->completedPlaybacks(), 1u);

    auto reqs = speech->requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0].url, "https://speech.googleapis.com/v1/speech:recognize");
    EXPECT_EQ(reqs[1].url, "https://texttospeech.googleapis.com/v1/text:synthesize");
    EXPECT_EQ(nlohmann::json::parse(reqs[1].body)["input"]["text"], "You spent 42.10 EUR on groceries.");

    auto last = rt->history->latest(Chat::Role::Assistant);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->walletLink, "https://pay.test/p/9");
}

TEST_F(RuntimeTest, ConsoleCommandsDriveTheRuntime) {
    g_runtime = rt.get();

    CommandResult off = handleCommand("mic_permission off");
    EXPECT_TRUE(off.success);
    EXPECT_FALSE(rt->permissions->hasMicrophonePermission());

    CommandResult voice = handleCommand("voice");
    EXPECT_EQ(voice.category, "async");
    ASSERT_TRUE(waitFor([&] { return notices.contains("ERR_VOICE_PERMISSION_DENIED"); }));
    EXPECT_EQ(mic->opens.load(), 0);

    EXPECT_EQ(handleCommand("mic_permission maybe").errorCode, "ERR_CORE_MISSING_ARGUMENT");
    EXPECT_EQ(handleCommand("speak").errorCode, "ERR_CORE_MISSING_ARGUMENT");

    backend->respondWith(FakeHttpTransport::ok(R"({"answer":"Noted."})"));
    EXPECT_EQ(handleCommand("chat add bread").category, "async");
    ASSERT_TRUE(waitFor([&] { return rt->chat->latestAssistantMessage().has_value(); }));

    CommandResult history = handleCommand("history");
    EXPECT_NE(history.message.find("you: add bread"), std::string::npos);
    EXPECT_NE(history.message.find("assistant: Noted."), std::string::npos);

    CommandResult status = handleCommand("status");
    EXPECT_TRUE(status.success);
    EXPECT_NE(status.message.find("Idle"), std::string::npos);
    EXPECT_NE(status.message.find("denied"), std::string::npos);
}

TEST_F(RuntimeTest, ShutdownStopsRecordingAndIsIdempotent) {
    mic->budget = 1000000;
    rt->session->requestToggle();
    ASSERT_TRUE(waitFor([&] { return rt->capture->isCapturing(); }));

    shutdownRuntime(*rt);
    EXPECT_TRUE(rt->stopped);
    EXPECT_FALSE(rt->capture->isCapturing());
    EXPECT_EQ(rt->session->state(), SessionState::Idle);
    EXPECT_EQ(speech->requestCount(), 0u);
    EXPECT_FALSE(rt->loop->post([]() {}));

    shutdownRuntime(*rt);
}
