#include "common/error.hpp"
#include "config/config_codec.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

using namespace soda;
using nlohmann::json;

namespace {

std::vector<char> cbor(const json& j) {
    const std::vector<std::uint8_t> bytes = json::to_cbor(j);
    return std::vector<char>(bytes.begin(), bytes.end());
}

std::optional<Config> decode(const std::vector<char>& bytes) {
    return decodeConfig(bytes.data(), bytes.size());
}

} // namespace

TEST(ConfigCodecTest, EncodesEveryField) {
    Config config;
    config.channelCount = 2;
    config.sampleRate = 48000;
    config.languagePackDirectory = "/opt/soda/en-US";
    config.apiKey = "key";
    config.recognitionMode = RecognitionMode::Caption;
    config.maxBufferBytes = 4096;
    config.simulateRealtimeTestOnly = true;
    config.resetOnFinalResult = false;
    config.includeTimingMetrics = false;
    config.enableLangId = true;

    const std::vector<char> bytes = encodeConfig(config);
    const json j = json::from_cbor(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));

    EXPECT_EQ(j.at("version"), CONFIG_SCHEMA_VERSION);
    EXPECT_EQ(j.at("channel_count"), 2);
    EXPECT_EQ(j.at("sample_rate"), 48000);
    EXPECT_EQ(j.at("language_pack_directory"), "/opt/soda/en-US");
    EXPECT_EQ(j.at("api_key"), "key");
    EXPECT_EQ(j.at("recognition_mode"), 2);
    EXPECT_EQ(j.at("max_buffer_bytes"), 4096);
    EXPECT_EQ(j.at("simulate_realtime_testonly"), true);
    EXPECT_EQ(j.at("reset_on_final_result"), false);
    EXPECT_EQ(j.at("include_timing_metrics"), false);
    EXPECT_EQ(j.at("enable_lang_id"), true);

    auto decoded = decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, config);
}

TEST(ConfigCodecTest, AbsentKeysTakeDefaults) {
    auto decoded = decode(cbor(json{{"version", 1}, {"sample_rate", 8000}}));
    ASSERT_TRUE(decoded.has_value());

    Config expected;
    expected.sampleRate = 8000;
    EXPECT_EQ(*decoded, expected);
}

TEST(ConfigCodecTest, UnknownKeysAreIgnored) {
    auto decoded = decode(cbor(json{{"version", 1}, {"future_option", "x"}}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, Config{});
}

TEST(ConfigCodecTest, UnknownRecognitionModeDecodesAsUnknown) {
    auto decoded = decode(cbor(json{{"recognition_mode", 9}}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->recognitionMode, RecognitionMode::Unknown);
}

TEST(ConfigCodecTest, RejectsMalformedInput) {
    const std::vector<char> garbage = {'\xFF', '\x00', '\x13'};
    EXPECT_FALSE(decode(garbage).has_value());
    EXPECT_FALSE(decodeConfig(nullptr, 0).has_value());
    EXPECT_FALSE(decode(cbor(json::array({1, 2}))).has_value());
}

TEST(ConfigCodecTest, RejectsMistypedFields) {
    EXPECT_FALSE(decode(cbor(json{{"sample_rate", "fast"}})).has_value());
    EXPECT_FALSE(decode(cbor(json{{"enable_lang_id", 1}})).has_value());
    EXPECT_FALSE(decode(cbor(json{{"api_key", 7}})).has_value());
}

TEST(ConfigCodecTest, RejectsOversizedContainerLengths) {
    const std::string hugeArray("\x9b\xff\xff\xff\xff\xff\xff\xff\xfe", 9);
    const std::string hugeMap("\xbb\xff\xff\xff\xff\xff\xff\xff\xfe", 9);
    EXPECT_FALSE(decodeConfig(hugeArray.data(), hugeArray.size()).has_value());
    EXPECT_FALSE(decodeConfig(hugeMap.data(), hugeMap.size()).has_value());
}

TEST(ConfigCodecTest, RejectsIntegersOutsideIntRange) {
    EXPECT_FALSE(decode(cbor(json{{"sample_rate", 1LL << 33}})).has_value());
    EXPECT_FALSE(decode(cbor(json{{"max_buffer_bytes", -(1LL << 40)}})).has_value());
    EXPECT_FALSE(decode(cbor(json{{"channel_count", std::numeric_limits<std::uint64_t>::max()}}))
                     .has_value());

    auto decoded = decode(cbor(json{{"sample_rate", std::numeric_limits<int>::max()}}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->sampleRate, std::numeric_limits<int>::max());
}

TEST(ConfigCodecTest, RejectsNewerSchemaVersion) {
    EXPECT_FALSE(decode(cbor(json{{"version", CONFIG_SCHEMA_VERSION + 1}})).has_value());
    EXPECT_FALSE(decode(cbor(json{{"version", 0}})).has_value());
}

TEST(ConfigCodecTest, InvalidUtf8CannotBeEncoded) {
    Config config;
    config.apiKey = "bad\xFF";
    try {
        encodeConfig(config);
        FAIL() << "expected SodaError";
    } catch (const SodaError& e) {
        EXPECT_EQ(e.kind(), SodaError::Kind::Serialization);
    }
}

TEST(FlatConfigRecordTest, RawStructBorrowsRecordStrings) {
    Config config;
    config.channelCount = 2;
    config.sampleRate = 44100;
    config.languagePackDirectory = "/models/en";
    config.apiKey = "abc";

    FlatConfigRecord record(config);
    int marker = 0;
    const SodaConfig raw = record.toRaw(nullptr, &marker);

    EXPECT_EQ(raw.channel_count, 2);
    EXPECT_EQ(raw.sample_rate, 44100);
    EXPECT_STREQ(raw.language_pack_directory, "/models/en");
    EXPECT_STREQ(raw.api_key, "abc");
    EXPECT_EQ(raw.callback, nullptr);
    EXPECT_EQ(raw.callback_handle, &marker);
}

TEST(FlatConfigRecordTest, EmbeddedNulIsRejected) {
    Config config;
    config.languagePackDirectory = std::string("/models\0/en", 11);
    try {
        FlatConfigRecord record(config);
        FAIL() << "expected SodaError";
    } catch (const SodaError& e) {
        EXPECT_EQ(e.kind(), SodaError::Kind::Serialization);
    }
}
