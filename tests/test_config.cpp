#include "bootstrap_config.hpp"
#include "error_manager.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace bootstrap_config;

namespace {

nlohmann::json readJson(const fs::path& p) {
    std::ifstream in(p);
    return nlohmann::json::parse(in);
}

} // namespace

TEST(MergeDefaultsTest, AddsMissingAndResetsMistypedKeys) {
    nlohmann::json defs = {
        {"speech", {{"language_code", "en-US"}, {"sample_rate_hz", 16000}}},
        {"chat", {{"backend_url", ""}}}
    };
    nlohmann::json cfg = {
        {"speech", {{"language_code", 7}, {"sample_rate_hz", 44100.0}}},
        {"extra", true}
    };

    int patched = 0;
    EXPECT_TRUE(mergeDefaults(cfg, defs, "", &patched));
    EXPECT_EQ(patched, 2);

    EXPECT_EQ(cfg["speech"]["language_code"], "en-US");
    EXPECT_EQ(cfg["speech"]["sample_rate_hz"], 44100.0); // number stays a number
    EXPECT_EQ(cfg["chat"]["backend_url"], "");
    EXPECT_EQ(cfg["extra"], true);

    // second pass has nothing to do
    EXPECT_FALSE(mergeDefaults(cfg, defs));
}

TEST(VoiceConfigTest, DefaultsProduceDocumentedValues) {
    VoiceConfig cfg = voiceConfigFromJson(defaultVoiceConfig());

    EXPECT_EQ(cfg.captureFormat.sampleRate, 16000u);
    EXPECT_EQ(cfg.captureFormat.channels, Voice::ChannelLayout::Mono);
    EXPECT_EQ(cfg.speechLanguage, "en-US");
    EXPECT_EQ(cfg.chunkMs, 100u);
    EXPECT_EQ(cfg.voice.sampleRate, 22050u);
    EXPECT_EQ(cfg.voice.voiceName, "en-US-Neural2-F");
    EXPECT_EQ(cfg.networkWorkers, 2u);
    EXPECT_EQ(cfg.networkTimeoutMs, 30000);
    EXPECT_TRUE(cfg.microphonePermission);
    EXPECT_EQ(cfg.recognizeUrl, "https://speech.googleapis.com/v1/speech:recognize");
    EXPECT_EQ(cfg.synthesizeUrl, "https://texttospeech.googleapis.com/v1/text:synthesize");
}

TEST(VoiceConfigTest, OutOfRangeValuesFallBack) {
    nlohmann::json j = defaultVoiceConfig();
    j["speech"]["sample_rate_hz"] = 96000;
    j["speech"]["chunk_ms"] = 0;
    j["speech"]["stop_timeout_ms"] = -5;
    j["tts"]["sample_rate_hz"] = 100;
    j["network"]["timeout_ms"] = 0;
    j["network"]["workers"] = 64;
    j["speech"]["microphone_permission"] = "yes";

    VoiceConfig cfg = voiceConfigFromJson(j);
    EXPECT_EQ(cfg.captureFormat.sampleRate, 16000u);
    EXPECT_EQ(cfg.chunkMs, 100u);
    EXPECT_EQ(cfg.stopTimeoutMs, 1000);
    EXPECT_EQ(cfg.voice.sampleRate, 22050u);
    EXPECT_EQ(cfg.networkTimeoutMs, 30000);
    EXPECT_EQ(cfg.networkWorkers, 2u);
    EXPECT_TRUE(cfg.microphonePermission);
}

TEST(VoiceConfigTest, ValidOverridesAreKept) {
    nlohmann::json j = defaultVoiceConfig();
    j["speech"]["sample_rate_hz"] = 48000;
    j["speech"]["language_code"] = "de-DE";
    j["speech"]["microphone_permission"] = false;
    j["chat"]["backend_url"] = "http://localhost:8000/ask";

    VoiceConfig cfg = voiceConfigFromJson(j);
    EXPECT_EQ(cfg.captureFormat.sampleRate, 48000u);
    EXPECT_EQ(cfg.speechLanguage, "de-DE");
    EXPECT_FALSE(cfg.microphonePermission);
    EXPECT_EQ(cfg.chatBackendUrl, "http://localhost:8000/ask");
}

TEST(VoiceConfigTest, EnvironmentOverridesApiKey) {
    VoiceConfig cfg = voiceConfigFromJson(defaultVoiceConfig());
    ::setenv("WALLETVOICE_GOOGLE_API_KEY", "env-key", 1);
    applyEnvironment(cfg);
    ::unsetenv("WALLETVOICE_GOOGLE_API_KEY");
    EXPECT_EQ(cfg.googleApiKey, "env-key");
}

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::use(defaultErrors());
        dir = fs::temp_directory_path() /
              ("walletvoice_cfg_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
        path = dir / "voice_config.json";
        fs::remove(path);
    }
    void TearDown() override { fs::remove_all(dir); }

    fs::path dir;
    fs::path path;
};

TEST_F(LoadConfigTest, MissingFileIsCreatedFromDefaults) {
    nlohmann::json out;
    EXPECT_TRUE(loadConfig(path, defaultVoiceConfig(), out, "Voice config"));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(readJson(path), defaultVoiceConfig());
    EXPECT_EQ(out, defaultVoiceConfig());
}

TEST_F(LoadConfigTest, BrokenFileIsResetToDefaults) {
    std::ofstream(path) << "{ this is not json";

    nlohmann::json out;
    EXPECT_FALSE(loadConfig(path, defaultVoiceConfig(), out, "Voice config", "ERR_CONFIG_INVALID"));
    EXPECT_EQ(out, defaultVoiceConfig());
    EXPECT_EQ(readJson(path), defaultVoiceConfig());
}

TEST_F(LoadConfigTest, NonObjectFileIsResetToDefaults) {
    std::ofstream(path) << "[1, 2, 3]";

    nlohmann::json out;
    EXPECT_FALSE(loadConfig(path, defaultVoiceConfig(), out, "Voice config"));
    EXPECT_TRUE(out.is_object());
}

TEST_F(LoadConfigTest, PartialFileIsPatchedAndUserValuesSurvive) {
    std::ofstream(path) << R"({"speech": {"language_code": "fr-FR"}, "api_keys": {"google": "abc"}})";

    nlohmann::json out;
    EXPECT_TRUE(loadConfig(path, defaultVoiceConfig(), out, "Voice config"));
    EXPECT_EQ(out["speech"]["language_code"], "fr-FR");
    EXPECT_EQ(out["speech"]["sample_rate_hz"], 16000);
    EXPECT_EQ(out["api_keys"]["google"], "abc");
    EXPECT_TRUE(out.contains("tts"));

    auto saved = readJson(path);
    EXPECT_EQ(saved["speech"]["language_code"], "fr-FR");
    EXPECT_TRUE(saved["network"].contains("workers"));
}
