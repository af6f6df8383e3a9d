#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace soda {

struct TimingMetrics {
    std::optional<std::int64_t> audioStartEpochUsec;
    std::optional<std::int64_t> audioStartTimeUsec;
    std::optional<std::int64_t> elapsedWallTimeUsec;
    std::optional<std::int64_t> eventEndTimeUsec;
};

struct RecognitionResult {
    enum class ResultType {
        Unknown = 0,
        Partial = 1,
        Final = 2,
        Prefetch = 3
    };

    enum class FinalResultEndReason {
        Unknown = 0,
        EndpointEndOfSpeech = 1,
        EndpointEndOfUtterance = 2,
        EndpointEndOfAudio = 3,
        EndpointAsrResetBySoda = 4,
        EndpointAsrResetByHotword = 5,
        EndpointAsrResetExternal = 6,
        EndpointAsrError = 7
    };

    // Ranked best first.
    std::vector<std::string> hypotheses;
    std::optional<ResultType> resultType;
    std::optional<FinalResultEndReason> finalResultEndReason;
    std::optional<TimingMetrics> timingMetrics;

    bool isFinal() const { return resultType == ResultType::Final; }
};

struct EndpointEvent {
    enum class EndpointType {
        StartOfSpeech = 0,
        EndOfSpeech = 1,
        EndOfAudio = 2,
        EndOfUtterance = 3,
        Unknown = 4
    };

    std::optional<EndpointType> endpointType;
    std::optional<TimingMetrics> timingMetrics;
};

struct AudioLevelInfo {
    std::optional<float> rms;
    std::optional<float> audioLevel;
    std::optional<std::int64_t> audioTimeUsec;
};

struct LangIdEvent {
    enum class AsrSwitchResult {
        DefaultNoSwitch = 0,
        SwitchSucceeded = 1,
        SwitchFailed = 2,
        SwitchSkippedNoLp = 3
    };

    std::optional<std::string> language;
    std::optional<int> confidenceLevel;
    std::optional<AsrSwitchResult> asrSwitchResult;
};

// One event reported through the serialized interface. Normally exactly one
// of the payload members is present, matching sodaType.
struct SodaResponse {
    enum class MessageType {
        Unknown = 0,
        Recognition = 1,
        Stop = 2,
        Shutdown = 3,
        Start = 4,
        Endpoint = 5,
        AudioLevel = 6,
        LangId = 7,
        LogsOnlyArtifact = 8
    };

    std::optional<MessageType> sodaType;
    std::optional<RecognitionResult> recognitionResult;
    std::optional<EndpointEvent> endpointEvent;
    std::optional<AudioLevelInfo> audioLevelInfo;
    std::optional<LangIdEvent> langIdEvent;
};

} // namespace soda
