#include "client/soda_builder.hpp"
#include "common/error.hpp"
#include "engine/vosk_engine.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>

using namespace soda;

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

TEST(VoskEngineTest, ExposesOnlyTheSerializedInterface) {
    const EngineApiPtr api = voskEngineApi();
    EXPECT_EQ(api->name, "vosk");
    EXPECT_TRUE(api->hasExtendedInterface());
    EXPECT_FALSE(api->hasSimpleInterface());
}

TEST(VoskEngineTest, MissingModelFailsCreation) {
    SodaBuilder builder;
    builder.engine(voskEngineApi()).languagePackDirectory("/nonexistent/vosk-model");
    try {
        builder.build([](const SodaResponse&) {});
        FAIL() << "expected SodaError";
    } catch (const SodaError& e) {
        EXPECT_EQ(e.kind(), SodaError::Kind::Creation);
    }
}

TEST(VoskEngineTest, MultiChannelAudioIsRefused) {
    SodaBuilder builder;
    builder.engine(voskEngineApi()).channelCount(2);
    EXPECT_THROW(builder.build([](const SodaResponse&) {}), SodaError);
}

// Needs VOSK_TEST_MODEL (model directory) and VOSK_TEST_AUDIO (16 kHz mono
// 16-bit PCM). VOSK_TEST_EXPECTED optionally names text the transcript holds.
TEST(VoskEngineTest, RecognizesRecording) {
    const char* model = env("VOSK_TEST_MODEL");
    const char* audioPath = env("VOSK_TEST_AUDIO");
    if (!model || !audioPath) GTEST_SKIP() << "VOSK_TEST_MODEL or VOSK_TEST_AUDIO not set";

    std::mutex mutex;
    std::condition_variable changed;
    std::string transcript;
    int finals = 0;
    int endpoints = 0;
    int levels = 0;

    SodaBuilder builder;
    builder.engine(voskEngineApi()).languagePackDirectory(model);
    SodaClient client = builder.build([&](const SodaResponse& response) {
        std::lock_guard<std::mutex> lock(mutex);
        if (response.audioLevelInfo) ++levels;
        if (response.endpointEvent) ++endpoints;
        const auto& result = response.recognitionResult;
        if (result && result->isFinal()) {
            if (!result->hypotheses.empty()) transcript += result->hypotheses.front() + " ";
            EXPECT_TRUE(result->timingMetrics.has_value());
            ++finals;
        }
        changed.notify_all();
    });

    std::ifstream audio(audioPath, std::ios::binary);
    ASSERT_TRUE(audio.is_open());
    client.addAudio(audio);

    // The last utterance is closed once the stream has been quiet for a while.
    std::unique_lock<std::mutex> lock(mutex);
    changed.wait_for(lock, std::chrono::seconds(10), [&] { return finals > 0 && endpoints > 0; });
    EXPECT_GT(finals, 0);
    EXPECT_GT(endpoints, 0);
    EXPECT_GT(levels, 0);
    if (const char* expected = env("VOSK_TEST_EXPECTED")) {
        EXPECT_NE(transcript.find(expected), std::string::npos) << transcript;
    }
}
