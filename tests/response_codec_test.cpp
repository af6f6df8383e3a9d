#include "recognition/response_codec.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace soda;
using nlohmann::json;

namespace {

std::vector<char> cbor(const json& j) {
    const std::vector<std::uint8_t> bytes = json::to_cbor(j);
    return std::vector<char>(bytes.begin(), bytes.end());
}

std::optional<SodaResponse> decode(const std::vector<char>& bytes) {
    return decodeResponse(bytes.data(), bytes.size());
}

} // namespace

TEST(ResponseCodecTest, DecodesFinalRecognitionResult) {
    auto response = decode(cbor({
        {"soda_type", 1},
        {"recognition_result", {
            {"hypothesis", {"turn on the lights", "turn on the light"}},
            {"result_type", 2},
            {"final_result_end_reason", 2},
            {"timing_metrics", {{"audio_start_time_usec", 1000}, {"event_end_time_usec", 250000}}}
        }}
    }));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->sodaType, SodaResponse::MessageType::Recognition);
    ASSERT_TRUE(response->recognitionResult.has_value());

    const RecognitionResult& result = *response->recognitionResult;
    ASSERT_EQ(result.hypotheses.size(), 2u);
    EXPECT_EQ(result.hypotheses[0], "turn on the lights");
    EXPECT_TRUE(result.isFinal());
    EXPECT_EQ(result.finalResultEndReason,
              RecognitionResult::FinalResultEndReason::EndpointEndOfUtterance);
    ASSERT_TRUE(result.timingMetrics.has_value());
    EXPECT_EQ(result.timingMetrics->audioStartTimeUsec, 1000);
    EXPECT_EQ(result.timingMetrics->eventEndTimeUsec, 250000);
    EXPECT_FALSE(result.timingMetrics->elapsedWallTimeUsec.has_value());

    EXPECT_FALSE(response->endpointEvent.has_value());
    EXPECT_FALSE(response->audioLevelInfo.has_value());
    EXPECT_FALSE(response->langIdEvent.has_value());
}

TEST(ResponseCodecTest, AbsentFieldsStayAbsent) {
    auto response = decode(cbor({{"recognition_result", json::object()}}));
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->sodaType.has_value());
    ASSERT_TRUE(response->recognitionResult.has_value());
    EXPECT_TRUE(response->recognitionResult->hypotheses.empty());
    EXPECT_FALSE(response->recognitionResult->resultType.has_value());
    EXPECT_FALSE(response->recognitionResult->isFinal());
}

TEST(ResponseCodecTest, DecodesEndpointAudioLevelAndLangId) {
    auto endpoint = decode(cbor({{"soda_type", 5}, {"endpoint_event", {{"endpoint_type", 1}}}}));
    ASSERT_TRUE(endpoint && endpoint->endpointEvent);
    EXPECT_EQ(endpoint->endpointEvent->endpointType, EndpointEvent::EndpointType::EndOfSpeech);

    auto level = decode(cbor({{"soda_type", 6},
                              {"audio_level_info", {{"rms", 0.25}, {"audio_level", 0.5},
                                                    {"audio_time_usec", 64000}}}}));
    ASSERT_TRUE(level && level->audioLevelInfo);
    EXPECT_FLOAT_EQ(*level->audioLevelInfo->rms, 0.25f);
    EXPECT_FLOAT_EQ(*level->audioLevelInfo->audioLevel, 0.5f);
    EXPECT_EQ(level->audioLevelInfo->audioTimeUsec, 64000);

    auto langId = decode(cbor({{"soda_type", 7},
                               {"langid_event", {{"language", "de-DE"}, {"confidence_level", 3},
                                                 {"asr_switch_result", 1}}}}));
    ASSERT_TRUE(langId && langId->langIdEvent);
    EXPECT_EQ(langId->langIdEvent->language, "de-DE");
    EXPECT_EQ(langId->langIdEvent->confidenceLevel, 3);
    EXPECT_EQ(langId->langIdEvent->asrSwitchResult, LangIdEvent::AsrSwitchResult::SwitchSucceeded);
}

TEST(ResponseCodecTest, OutOfRangeEnumsReadAsAbsent) {
    auto response = decode(cbor({{"soda_type", 42},
                                 {"recognition_result", {{"result_type", -1}}},
                                 {"endpoint_event", {{"endpoint_type", 17}}}}));
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->sodaType.has_value());
    EXPECT_FALSE(response->recognitionResult->resultType.has_value());
    ASSERT_TRUE(response->endpointEvent.has_value());
    EXPECT_FALSE(response->endpointEvent->endpointType.has_value());
}

TEST(ResponseCodecTest, MissingEndpointTypeIsAbsentNotUnknown) {
    auto missing = decode(cbor({{"soda_type", 5}, {"endpoint_event", json::object()}}));
    ASSERT_TRUE(missing && missing->endpointEvent);
    EXPECT_FALSE(missing->endpointEvent->endpointType.has_value());

    auto unknown = decode(cbor({{"soda_type", 5}, {"endpoint_event", {{"endpoint_type", 4}}}}));
    ASSERT_TRUE(unknown && unknown->endpointEvent);
    EXPECT_EQ(unknown->endpointEvent->endpointType, EndpointEvent::EndpointType::Unknown);
}

TEST(ResponseCodecTest, OversizedContainerLengthsAreRejected) {
    const std::string hugeArray("\x9b\xff\xff\xff\xff\xff\xff\xff\xfe", 9);
    const std::string hugeMap("\xbb\xff\xff\xff\xff\xff\xff\xff\xfe", 9);
    EXPECT_FALSE(decodeResponse(hugeArray.data(), hugeArray.size()).has_value());
    EXPECT_FALSE(decodeResponse(hugeMap.data(), hugeMap.size()).has_value());
}

TEST(ResponseCodecTest, IntegersOutOfRangeAreMalformed) {
    EXPECT_FALSE(decode(cbor({{"langid_event", {{"confidence_level", 1LL << 40}}}})).has_value());
    EXPECT_FALSE(decode(cbor({{"audio_level_info",
                               {{"audio_time_usec", std::numeric_limits<std::uint64_t>::max()}}}}))
                     .has_value());

    auto ok = decode(cbor({{"langid_event", {{"confidence_level", -2}}}}));
    ASSERT_TRUE(ok && ok->langIdEvent);
    EXPECT_EQ(ok->langIdEvent->confidenceLevel, -2);
}

TEST(ResponseCodecTest, MalformedPayloadsAreRejected) {
    const std::vector<char> truncated = {'\xA1', '\x69'};
    EXPECT_FALSE(decode(truncated).has_value());
    EXPECT_FALSE(decodeResponse(nullptr, 0).has_value());
    EXPECT_FALSE(decode(cbor("just a string")).has_value());
    EXPECT_FALSE(decode(cbor({{"recognition_result", {{"hypothesis", "not a list"}}}})).has_value());
    EXPECT_FALSE(decode(cbor({{"recognition_result", {{"hypothesis", {1, 2}}}}})).has_value());
    EXPECT_FALSE(decode(cbor({{"audio_level_info", {{"rms", "loud"}}}})).has_value());
    EXPECT_FALSE(decode(cbor({{"langid_event", 5}})).has_value());
}

TEST(ResponseCodecTest, DecodesOnlyTheGivenLength) {
    std::vector<char> bytes = cbor({{"soda_type", 4}});
    const std::size_t length = bytes.size();
    bytes.push_back('\xFF');
    bytes.push_back('\xFF');

    auto response = decodeResponse(bytes.data(), length);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->sodaType, SodaResponse::MessageType::Start);
}

TEST(ResponseCodecTest, EncodedResponseDecodesToTheSameEvent) {
    SodaResponse response;
    response.sodaType = SodaResponse::MessageType::Recognition;
    RecognitionResult result;
    result.hypotheses = {"hello"};
    result.resultType = RecognitionResult::ResultType::Partial;
    response.recognitionResult = result;

    const std::vector<char> bytes = encodeResponse(response);
    auto decoded = decodeResponse(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->sodaType, response.sodaType);
    ASSERT_TRUE(decoded->recognitionResult.has_value());
    EXPECT_EQ(decoded->recognitionResult->hypotheses, result.hypotheses);
    EXPECT_EQ(decoded->recognitionResult->resultType, result.resultType);
    EXPECT_FALSE(decoded->recognitionResult->timingMetrics.has_value());
}
