#pragma once

#include <optional>
#include <string>

namespace soda {

enum class RecognitionMode {
    Unknown = 0,
    Ime = 1,      // interactive input
    Caption = 2
};

const char* toString(RecognitionMode mode);
std::optional<RecognitionMode> recognitionModeFromString(const std::string& name);

// Recognition parameters for one engine instance. Channel count and sample
// rate cannot change mid-stream; a new instance is needed instead.
struct Config {
    static constexpr int DEFAULT_CHANNEL_COUNT = 1;
    static constexpr int DEFAULT_SAMPLE_RATE = 16000;
    static constexpr const char* DEFAULT_LANGUAGE_PACK_DIRECTORY = "./SODAModels";
    static constexpr const char* DEFAULT_API_KEY = "dummy_key";

    int channelCount{DEFAULT_CHANNEL_COUNT};
    int sampleRate{DEFAULT_SAMPLE_RATE};
    std::string languagePackDirectory{DEFAULT_LANGUAGE_PACK_DIRECTORY};
    std::string apiKey{DEFAULT_API_KEY};

    // Serialized interface only.
    RecognitionMode recognitionMode{RecognitionMode::Ime};
    int maxBufferBytes{0};                  // 0 = unlimited
    bool simulateRealtimeTestOnly{false};
    bool resetOnFinalResult{true};
    bool includeTimingMetrics{true};
    bool enableLangId{false};
};

bool operator==(const Config& a, const Config& b);
inline bool operator!=(const Config& a, const Config& b) { return !(a == b); }

} // namespace soda
