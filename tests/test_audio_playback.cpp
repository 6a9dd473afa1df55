#include "voice/audio_playback.hpp"
#include "voice/worker_pool.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <future>

using namespace test_utils;
using Voice::VoiceError;

namespace {

Voice::PcmBuffer tone(std::size_t bytes) {
    Voice::PcmBuffer pcm(bytes);
    for (std::size_t i = 0; i < bytes; ++i) pcm[i] = static_cast<std::uint8_t>(i * 7);
    return pcm;
}

} // namespace

class AudioPlaybackTest : public ::testing::Test {
protected:
    void TearDown() override {
        script->release();
        pool.shutdown();
    }

    // Plays and waits for the completion result
    VoiceError playAndWait(Voice::PcmBuffer pcm, unsigned rate) {
        std::promise<VoiceError> done;
        auto fut = done.get_future();
        VoiceError accepted = playback.play(std::move(pcm), rate, [&done](VoiceError r) {
            done.set_value(r);
        });
        if (accepted != VoiceError::None) return accepted;
        if (fut.wait_for(std::chrono::seconds(3)) != std::future_status::ready) {
            ADD_FAILURE() << "playback never completed";
            return VoiceError::None;
        }
        return fut.get();
    }

    std::shared_ptr<PlaybackScript> script = std::make_shared<PlaybackScript>();
    Voice::WorkerPool pool{"playback", 1};
    Voice::AudioPlaybackController playback{playbackFactory(script), pool};
};

TEST_F(AudioPlaybackTest, PlaysSynthesizedSpeechAtItsRate) {
    auto pcm = tone(44100);
    EXPECT_EQ(playAndWait(pcm, 22050), VoiceError::None);

    EXPECT_EQ(script->lastRate.load(), 22050u);
    EXPECT_EQ(script->lastBufferBytes.load(), 4410u);
    EXPECT_EQ(script->opens.load(), 1);
    EXPECT_EQ(script->closes.load(), 1);
    {
        std::lock_guard<std::mutex> lock(script->mtx);
        EXPECT_EQ(script->written, pcm);
    }
    EXPECT_FALSE(playback.isActive());
    EXPECT_EQ(playback.completedPlaybacks(), 1u);
}

TEST_F(AudioPlaybackTest, SecondPlayIsRejectedWhileFirstIsWriting) {
    script->holdWrites = true;

    std::promise<VoiceError> first;
    auto firstDone = first.get_future();
    ASSERT_EQ(playback.play(tone(2000), 22050, [&first](VoiceError r) { first.set_value(r); }),
              VoiceError::None);
    ASSERT_TRUE(waitFor([&] { return script->writing.load(); }));
    EXPECT_TRUE(playback.isActive());

    bool secondCalled = false;
    EXPECT_EQ(playback.play(tone(2000), 22050, [&secondCalled](VoiceError) { secondCalled = true; }),
              VoiceError::PlaybackBusy);

    script->release();
    ASSERT_EQ(firstDone.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_EQ(firstDone.get(), VoiceError::None);
    EXPECT_FALSE(secondCalled);
    EXPECT_EQ(script->writes.load(), 1);

    // device is free again
    EXPECT_EQ(playAndWait(tone(2000), 22050), VoiceError::None);
}

TEST_F(AudioPlaybackTest, DeviceFlagIsClearBeforeCompletionRuns) {
    std::promise<bool> seen;
    auto fut = seen.get_future();
    ASSERT_EQ(playback.play(tone(100), 16000, [&](VoiceError) { seen.set_value(playback.isActive()); }),
              VoiceError::None);
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_FALSE(fut.get());
}

TEST_F(AudioPlaybackTest, UndecodableAudioIsRejectedWithoutOpeningDevice) {
    EXPECT_EQ(playAndWait(tone(101), 22050), VoiceError::ParseFailure); // half a frame
    EXPECT_EQ(playAndWait({}, 22050), VoiceError::ParseFailure);
    EXPECT_EQ(playAndWait(tone(100), 0), VoiceError::ParseFailure);

    EXPECT_EQ(script->opens.load(), 0);
    EXPECT_FALSE(playback.isActive());
}

TEST_F(AudioPlaybackTest, WriteErrorClosesDeviceAndNextPlayWorks) {
    script->throwOnWrite = true;
    EXPECT_EQ(playAndWait(tone(400), 22050), VoiceError::DeviceWriteFailure);
    EXPECT_EQ(script->closes.load(), 1);
    EXPECT_FALSE(playback.isActive());

    script->throwOnWrite = false;
    EXPECT_EQ(playAndWait(tone(400), 22050), VoiceError::None);
    EXPECT_EQ(playback.completedPlaybacks(), 2u);
}

TEST_F(AudioPlaybackTest, OpenFailureReportsDeviceInit) {
    script->failOpen = true;
    EXPECT_EQ(playAndWait(tone(400), 22050), VoiceError::DeviceInitFailure);
    EXPECT_FALSE(playback.isActive());
}

TEST_F(AudioPlaybackTest, ShutDownPoolRefusesAndReleasesDevice) {
    pool.shutdown();
    EXPECT_EQ(playback.play(tone(400), 22050), VoiceError::DeviceInitFailure);
    EXPECT_FALSE(playback.isActive());
}

TEST(PlaybackLeaseTest, OnlyOneHolderAtATime) {
    std::atomic<bool> flag{false};

    auto first = Voice::PlaybackLease::tryAcquire(flag);
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(flag.load());
    EXPECT_FALSE(Voice::PlaybackLease::tryAcquire(flag).has_value());

    Voice::PlaybackLease moved = std::move(*first);
    EXPECT_FALSE(first->held());
    EXPECT_TRUE(moved.held());

    moved.release();
    EXPECT_FALSE(flag.load());
    EXPECT_TRUE(Voice::PlaybackLease::tryAcquire(flag).has_value());
    EXPECT_FALSE(flag.load()); // temporary released on destruction
}
