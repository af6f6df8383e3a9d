#include "config/config_codec.hpp"

#include "common/debug_log.hpp"
#include "common/error.hpp"
#include "common/utf8.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace soda {

using nlohmann::json;

namespace {

void requireUtf8(const std::string& value, const char* field) {
    if (!utf8::isValid(value)) {
        throw SodaError(SodaError::Kind::Serialization,
                        std::string("Cannot encode ") + field + ": not valid UTF-8");
    }
}

void requireNoNul(const std::string& value, const char* field) {
    if (value.find('\0') != std::string::npos) {
        throw SodaError(SodaError::Kind::Serialization,
                        std::string("Cannot pass ") + field + " as a C string: embedded NUL");
    }
}

bool readInt(const json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer()) return false;
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(value);
        return true;
    }
    const auto value = it->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool readBool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_boolean()) return false;
    out = it->get<bool>();
    return true;
}

bool readString(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

std::vector<char> encodeConfig(const Config& config) {
    requireUtf8(config.apiKey, "api_key");
    requireUtf8(config.languagePackDirectory, "language_pack_directory");

    json j = {
        {"version", CONFIG_SCHEMA_VERSION},
        {"channel_count", config.channelCount},
        {"sample_rate", config.sampleRate},
        {"max_buffer_bytes", config.maxBufferBytes},
        {"simulate_realtime_testonly", config.simulateRealtimeTestOnly},
        {"api_key", config.apiKey},
        {"language_pack_directory", config.languagePackDirectory},
        {"recognition_mode", static_cast<int>(config.recognitionMode)},
        {"reset_on_final_result", config.resetOnFinalResult},
        {"include_timing_metrics", config.includeTimingMetrics},
        {"enable_lang_id", config.enableLangId}
    };

    const std::vector<std::uint8_t> bytes = json::to_cbor(j);
    return std::vector<char>(bytes.begin(), bytes.end());
}

std::optional<Config> decodeConfig(const char* data, std::size_t size) {
    if (!data || size == 0) return std::nullopt;

    const auto* begin = reinterpret_cast<const std::uint8_t*>(data);
    json j;
    try {
        j = json::from_cbor(begin, begin + size, true, false);
    } catch (const json::exception& e) {
        SODA_DEBUG_LOG("config record rejected: " << e.what());
        return std::nullopt;
    }
    if (j.is_discarded() || !j.is_object()) {
        SODA_DEBUG_LOG("config record is not a CBOR map");
        return std::nullopt;
    }

    int version = CONFIG_SCHEMA_VERSION;
    if (!readInt(j, "version", version) || version > CONFIG_SCHEMA_VERSION || version < 1) {
        SODA_DEBUG_LOG("unsupported config schema version");
        return std::nullopt;
    }

    Config config;
    int mode = static_cast<int>(config.recognitionMode);
    const bool ok =
        readInt(j, "channel_count", config.channelCount) &&
        readInt(j, "sample_rate", config.sampleRate) &&
        readInt(j, "max_buffer_bytes", config.maxBufferBytes) &&
        readBool(j, "simulate_realtime_testonly", config.simulateRealtimeTestOnly) &&
        readString(j, "api_key", config.apiKey) &&
        readString(j, "language_pack_directory", config.languagePackDirectory) &&
        readInt(j, "recognition_mode", mode) &&
        readBool(j, "reset_on_final_result", config.resetOnFinalResult) &&
        readBool(j, "include_timing_metrics", config.includeTimingMetrics) &&
        readBool(j, "enable_lang_id", config.enableLangId);
    if (!ok) {
        SODA_DEBUG_LOG("config record has a mistyped field");
        return std::nullopt;
    }

    switch (mode) {
        case static_cast<int>(RecognitionMode::Ime):
        case static_cast<int>(RecognitionMode::Caption):
            config.recognitionMode = static_cast<RecognitionMode>(mode);
            break;
        default:
            config.recognitionMode = RecognitionMode::Unknown;
            break;
    }
    return config;
}

FlatConfigRecord::FlatConfigRecord(const Config& config)
    : channelCount_(config.channelCount),
      sampleRate_(config.sampleRate),
      languagePackDirectory_(config.languagePackDirectory),
      apiKey_(config.apiKey) {
    requireNoNul(languagePackDirectory_, "language_pack_directory");
    requireNoNul(apiKey_, "api_key");
}

SodaConfig FlatConfigRecord::toRaw(RecognitionResultHandler callback, void* callbackHandle) const {
    SodaConfig raw{};
    raw.channel_count = channelCount_;
    raw.sample_rate = sampleRate_;
    raw.language_pack_directory = languagePackDirectory_.c_str();
    raw.callback = callback;
    raw.callback_handle = callbackHandle;
    raw.api_key = apiKey_.c_str();
    return raw;
}

} // namespace soda
