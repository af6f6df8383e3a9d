#include "config/soda_config.hpp"

#include <algorithm>
#include <cctype>

namespace soda {

const char* toString(RecognitionMode mode) {
    switch (mode) {
        case RecognitionMode::Ime: return "ime";
        case RecognitionMode::Caption: return "caption";
        case RecognitionMode::Unknown: break;
    }
    return "unknown";
}

std::optional<RecognitionMode> recognitionModeFromString(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "ime") return RecognitionMode::Ime;
    if (lower == "caption") return RecognitionMode::Caption;
    return std::nullopt;
}

bool operator==(const Config& a, const Config& b) {
    return a.channelCount == b.channelCount &&
           a.sampleRate == b.sampleRate &&
           a.languagePackDirectory == b.languagePackDirectory &&
           a.apiKey == b.apiKey &&
           a.recognitionMode == b.recognitionMode &&
           a.maxBufferBytes == b.maxBufferBytes &&
           a.simulateRealtimeTestOnly == b.simulateRealtimeTestOnly &&
           a.resetOnFinalResult == b.resetOnFinalResult &&
           a.includeTimingMetrics == b.includeTimingMetrics &&
           a.enableLangId == b.enableLangId;
}

} // namespace soda
