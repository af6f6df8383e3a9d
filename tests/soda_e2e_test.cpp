#include "client/soda_builder.hpp"
#include "engine/engine_library.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

using namespace soda;

// Runs against a real engine library and language pack:
//   SODA_LIBRARY_PATH        libsoda shared object
//   SODA_TEST_LANGUAGE_PACK  language pack directory
//   SODA_TEST_AUDIO          16 kHz mono 16-bit PCM recording
//   SODA_TEST_EXPECTED       optional text the final transcript must contain

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

struct Transcript {
    std::mutex mutex;
    std::condition_variable changed;
    std::string finalText;
    int finals = 0;

    void add(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!finalText.empty() && !text.empty()) finalText += ' ';
        finalText += text;
        ++finals;
        changed.notify_all();
    }
};

} // namespace

TEST(SodaEndToEndTest, StructuredClientProducesFinalTranscript) {
    const char* library = env("SODA_LIBRARY_PATH");
    const char* pack = env("SODA_TEST_LANGUAGE_PACK");
    const char* audioPath = env("SODA_TEST_AUDIO");
    if (!library || !pack || !audioPath) {
        GTEST_SKIP() << "SODA_LIBRARY_PATH, SODA_TEST_LANGUAGE_PACK or SODA_TEST_AUDIO not set";
    }

    Transcript transcript;
    SodaBuilder builder;
    builder.engine(EngineLibrary::load(library)).languagePackDirectory(pack);
    SodaClient client = builder.build([&](const SodaResponse& response) {
        const auto& result = response.recognitionResult;
        if (result && result->isFinal() && !result->hypotheses.empty()) {
            transcript.add(result->hypotheses.front());
        }
    });

    std::ifstream audio(audioPath, std::ios::binary);
    ASSERT_TRUE(audio.is_open());
    const FeedResult fed = client.addSimulatedAudio(audio);
    EXPECT_GT(fed.chunks, 0u);
    EXPECT_FALSE(fed.readError);

    std::unique_lock<std::mutex> lock(transcript.mutex);
    transcript.changed.wait_for(lock, std::chrono::seconds(5), [&] { return transcript.finals > 0; });
    ASSERT_GT(transcript.finals, 0);
    if (const char* expected = env("SODA_TEST_EXPECTED")) {
        EXPECT_NE(transcript.finalText.find(expected), std::string::npos) << transcript.finalText;
    }
}

TEST(SodaEndToEndTest, PlainTextClientProducesFinalTranscript) {
    const char* library = env("SODA_LIBRARY_PATH");
    const char* pack = env("SODA_TEST_LANGUAGE_PACK");
    const char* audioPath = env("SODA_TEST_AUDIO");
    if (!library || !pack || !audioPath) {
        GTEST_SKIP() << "SODA_LIBRARY_PATH, SODA_TEST_LANGUAGE_PACK or SODA_TEST_AUDIO not set";
    }

    auto engine = EngineLibrary::load(library);
    if (!engine->hasSimpleInterface()) {
        GTEST_SKIP() << library << " has no plain-text interface";
    }

    Transcript transcript;
    SodaBuilder builder;
    builder.engine(engine).languagePackDirectory(pack);
    SimpleSodaClient client = builder.buildSimple([&](const std::string& text, bool isFinal) {
        if (isFinal) transcript.add(text);
    });

    std::ifstream audio(audioPath, std::ios::binary);
    ASSERT_TRUE(audio.is_open());
    client.addSimulatedAudio(audio);

    std::unique_lock<std::mutex> lock(transcript.mutex);
    transcript.changed.wait_for(lock, std::chrono::seconds(5), [&] { return transcript.finals > 0; });
    EXPECT_GT(transcript.finals, 0);
}
