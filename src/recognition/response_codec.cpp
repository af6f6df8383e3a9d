#include "recognition/response_codec.hpp"

#include "common/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace soda {

using nlohmann::json;

namespace {

struct MalformedField : std::runtime_error {
    explicit MalformedField(const std::string& key)
        : std::runtime_error("malformed field: " + key) {}
};

const json* find(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
}

std::optional<std::int64_t> optionalInt(const json& j, const char* key) {
    const json* v = find(j, key);
    if (!v) return std::nullopt;
    if (!v->is_number_integer()) throw MalformedField(key);
    if (v->is_number_unsigned() &&
        v->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw MalformedField(key);
    }
    return v->get<std::int64_t>();
}

std::optional<float> optionalFloat(const json& j, const char* key) {
    const json* v = find(j, key);
    if (!v) return std::nullopt;
    if (!v->is_number()) throw MalformedField(key);
    return v->get<float>();
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    const json* v = find(j, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) throw MalformedField(key);
    return v->get<std::string>();
}

const json* optionalObject(const json& j, const char* key) {
    const json* v = find(j, key);
    if (v && !v->is_object()) throw MalformedField(key);
    return v;
}

// Out-of-range enumerators read as absent.
template <typename Enum>
std::optional<Enum> optionalEnum(const json& j, const char* key, int last) {
    auto raw = optionalInt(j, key);
    if (!raw || *raw < 0 || *raw > last) return std::nullopt;
    return static_cast<Enum>(*raw);
}

TimingMetrics decodeTiming(const json& j) {
    TimingMetrics timing;
    timing.audioStartEpochUsec = optionalInt(j, "audio_start_epoch_usec");
    timing.audioStartTimeUsec = optionalInt(j, "audio_start_time_usec");
    timing.elapsedWallTimeUsec = optionalInt(j, "elapsed_wall_time_usec");
    timing.eventEndTimeUsec = optionalInt(j, "event_end_time_usec");
    return timing;
}

std::optional<TimingMetrics> optionalTiming(const json& j) {
    const json* t = optionalObject(j, "timing_metrics");
    if (!t) return std::nullopt;
    return decodeTiming(*t);
}

RecognitionResult decodeRecognition(const json& j) {
    RecognitionResult result;
    if (const json* hyps = find(j, "hypothesis")) {
        if (!hyps->is_array()) throw MalformedField("hypothesis");
        for (const auto& h : *hyps) {
            if (!h.is_string()) throw MalformedField("hypothesis");
            result.hypotheses.push_back(h.get<std::string>());
        }
    }
    result.resultType = optionalEnum<RecognitionResult::ResultType>(j, "result_type", 3);
    result.finalResultEndReason =
        optionalEnum<RecognitionResult::FinalResultEndReason>(j, "final_result_end_reason", 7);
    result.timingMetrics = optionalTiming(j);
    return result;
}

EndpointEvent decodeEndpoint(const json& j) {
    EndpointEvent event;
    event.endpointType = optionalEnum<EndpointEvent::EndpointType>(j, "endpoint_type", 4);
    event.timingMetrics = optionalTiming(j);
    return event;
}

AudioLevelInfo decodeAudioLevel(const json& j) {
    AudioLevelInfo info;
    info.rms = optionalFloat(j, "rms");
    info.audioLevel = optionalFloat(j, "audio_level");
    info.audioTimeUsec = optionalInt(j, "audio_time_usec");
    return info;
}

LangIdEvent decodeLangId(const json& j) {
    LangIdEvent event;
    event.language = optionalString(j, "language");
    if (auto confidence = optionalInt(j, "confidence_level")) {
        if (*confidence < std::numeric_limits<int>::min() ||
            *confidence > std::numeric_limits<int>::max()) {
            throw MalformedField("confidence_level");
        }
        event.confidenceLevel = static_cast<int>(*confidence);
    }
    event.asrSwitchResult = optionalEnum<LangIdEvent::AsrSwitchResult>(j, "asr_switch_result", 3);
    return event;
}

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template <typename Enum>
void putOptionalEnum(json& j, const char* key, const std::optional<Enum>& value) {
    if (value) j[key] = static_cast<int>(*value);
}

json encodeTiming(const TimingMetrics& timing) {
    json j = json::object();
    putOptional(j, "audio_start_epoch_usec", timing.audioStartEpochUsec);
    putOptional(j, "audio_start_time_usec", timing.audioStartTimeUsec);
    putOptional(j, "elapsed_wall_time_usec", timing.elapsedWallTimeUsec);
    putOptional(j, "event_end_time_usec", timing.eventEndTimeUsec);
    return j;
}

} // namespace

std::optional<SodaResponse> decodeResponse(const char* data, std::size_t size) {
    if (!data || size == 0) return std::nullopt;

    const auto* begin = reinterpret_cast<const std::uint8_t*>(data);
    json j;
    try {
        // Size limits still throw with exceptions disabled.
        j = json::from_cbor(begin, begin + size, true, false);
    } catch (const json::exception& e) {
        SODA_DEBUG_LOG("dropping response: " << e.what());
        return std::nullopt;
    }
    if (j.is_discarded() || !j.is_object()) {
        SODA_DEBUG_LOG("dropping undecodable response of " << size << " bytes");
        return std::nullopt;
    }

    try {
        SodaResponse response;
        response.sodaType = optionalEnum<SodaResponse::MessageType>(j, "soda_type", 8);
        if (const json* r = optionalObject(j, "recognition_result")) {
            response.recognitionResult = decodeRecognition(*r);
        }
        if (const json* e = optionalObject(j, "endpoint_event")) {
            response.endpointEvent = decodeEndpoint(*e);
        }
        if (const json* a = optionalObject(j, "audio_level_info")) {
            response.audioLevelInfo = decodeAudioLevel(*a);
        }
        if (const json* l = optionalObject(j, "langid_event")) {
            response.langIdEvent = decodeLangId(*l);
        }
        return response;
    } catch (const MalformedField& e) {
        SODA_DEBUG_LOG("dropping response: " << e.what());
        return std::nullopt;
    }
}

std::vector<char> encodeResponse(const SodaResponse& response) {
    json j = json::object();
    putOptionalEnum(j, "soda_type", response.sodaType);

    if (const auto& r = response.recognitionResult) {
        json result = json::object();
        result["hypothesis"] = r->hypotheses;
        putOptionalEnum(result, "result_type", r->resultType);
        putOptionalEnum(result, "final_result_end_reason", r->finalResultEndReason);
        if (r->timingMetrics) result["timing_metrics"] = encodeTiming(*r->timingMetrics);
        j["recognition_result"] = std::move(result);
    }
    if (const auto& e = response.endpointEvent) {
        json event = json::object();
        putOptionalEnum(event, "endpoint_type", e->endpointType);
        if (e->timingMetrics) event["timing_metrics"] = encodeTiming(*e->timingMetrics);
        j["endpoint_event"] = std::move(event);
    }
    if (const auto& a = response.audioLevelInfo) {
        json info = json::object();
        putOptional(info, "rms", a->rms);
        putOptional(info, "audio_level", a->audioLevel);
        putOptional(info, "audio_time_usec", a->audioTimeUsec);
        j["audio_level_info"] = std::move(info);
    }
    if (const auto& l = response.langIdEvent) {
        json event = json::object();
        putOptional(event, "language", l->language);
        putOptional(event, "confidence_level", l->confidenceLevel);
        putOptionalEnum(event, "asr_switch_result", l->asrSwitchResult);
        j["langid_event"] = std::move(event);
    }

    const std::vector<std::uint8_t> bytes = json::to_cbor(j);
    return std::vector<char>(bytes.begin(), bytes.end());
}

} // namespace soda
