// vosk_engine.cpp
#include "engine/vosk_engine.hpp"

#include "audio/pcm.hpp"
#include "common/debug_log.hpp"
#include "config/config_codec.hpp"
#include "recognition/response_codec.hpp"

#include <vosk_api.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace soda {

namespace {

using Clock = std::chrono::steady_clock;

class VoskEngine {
public:
    static constexpr int MAX_ALTERNATIVES = 3;
    static constexpr std::chrono::milliseconds END_OF_AUDIO_TIMEOUT{1000};

    VoskEngine(const Config& config, SerializedSodaResultHandler callback, void* callbackHandle)
        : config_(config), callback_(callback), callbackHandle_(callbackHandle) {}

    ~VoskEngine() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    VoskEngine(const VoskEngine&) = delete;
    VoskEngine& operator=(const VoskEngine&) = delete;

    bool init();
    void start();
    void addAudio(const char* data, int size);

private:
    struct VoskModelDeleter {
        void operator()(VoskModel* p) { if (p) vosk_model_free(p); }
    };
    struct VoskRecognizerDeleter {
        void operator()(VoskRecognizer* p) { if (p) vosk_recognizer_free(p); }
    };

    void run();
    void process(std::vector<char> chunk);
    void finishUtterance(RecognitionResult::FinalResultEndReason reason, const char* json);
    void emitPartial(const std::string& text);
    void emitAudioLevel(const std::int16_t* samples, std::size_t count);
    void emit(const SodaResponse& response);
    std::optional<TimingMetrics> timing() const;
    std::int64_t audioTimeUsec() const;

    Config config_;
    SerializedSodaResultHandler callback_;
    void* callbackHandle_;

    std::unique_ptr<VoskModel, VoskModelDeleter> model_;
    std::unique_ptr<VoskRecognizer, VoskRecognizerDeleter> recognizer_;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::vector<char>> queue_;
    std::size_t queuedBytes_{0};
    bool stopping_{false};
    std::thread worker_;

    // Worker thread only.
    std::vector<char> carry_;
    std::string lastPartial_;
    std::int64_t samplesProcessed_{0};
    std::int64_t utteranceStartUsec_{0};
    std::int64_t audioStartEpochUsec_{0};
    Clock::time_point audioStart_;
    bool audioStarted_{false};
};

bool VoskEngine::init() {
    vosk_set_log_level(-1);

    auto* model = vosk_model_new(config_.languagePackDirectory.c_str());
    if (!model) {
        std::cerr << "Failed to load Vosk model from " << config_.languagePackDirectory << "\n";
        return false;
    }
    model_.reset(model);

    auto* recognizer = vosk_recognizer_new(model_.get(), static_cast<float>(config_.sampleRate));
    if (!recognizer) {
        std::cerr << "Failed to create Vosk recognizer at " << config_.sampleRate << " Hz\n";
        model_.reset();
        return false;
    }
    recognizer_.reset(recognizer);

    vosk_recognizer_set_max_alternatives(recognizer_.get(), MAX_ALTERNATIVES);

    if (config_.enableLangId) {
        std::cerr << "Warning: language identification is not available with the Vosk engine\n";
    }
    return true;
}

void VoskEngine::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable() || stopping_) return;
    worker_ = std::thread([this] { run(); });
}

void VoskEngine::addAudio(const char* data, int size) {
    if (!data || size <= 0) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.emplace_back(data, data + size);
        queuedBytes_ += static_cast<std::size_t>(size);

        if (config_.maxBufferBytes > 0) {
            const auto cap = static_cast<std::size_t>(config_.maxBufferBytes);
            while (queuedBytes_ > cap && queue_.size() > 1) {
                queuedBytes_ -= queue_.front().size();
                queue_.pop_front();
                std::cerr << "Warning: Vosk engine buffer full, dropping audio\n";
            }
        }
    }
    wake_.notify_one();
}

void VoskEngine::run() {
    while (true) {
        std::vector<char> chunk;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            const bool ready = wake_.wait_for(lock, END_OF_AUDIO_TIMEOUT,
                                              [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) return;
            if (ready) {
                chunk = std::move(queue_.front());
                queue_.pop_front();
                queuedBytes_ -= chunk.size();
            }
        }

        try {
            if (!chunk.empty()) {
                process(std::move(chunk));
            } else if (!lastPartial_.empty()) {
                // The stream went quiet: close the pending utterance.
                finishUtterance(RecognitionResult::FinalResultEndReason::EndpointEndOfAudio,
                                vosk_recognizer_final_result(recognizer_.get()));
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: Vosk engine worker: " << e.what() << "\n";
        }
    }
}

void VoskEngine::process(std::vector<char> chunk) {
    if (!audioStarted_) {
        audioStarted_ = true;
        audioStart_ = Clock::now();
        audioStartEpochUsec_ = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    if (!carry_.empty()) {
        chunk.insert(chunk.begin(), carry_.begin(), carry_.end());
        carry_.clear();
    }
    if (chunk.size() % 2 != 0) {
        carry_.push_back(chunk.back());
        chunk.pop_back();
    }
    if (chunk.empty()) return;

    const auto* samples = reinterpret_cast<const std::int16_t*>(chunk.data());
    const std::size_t count = chunk.size() / sizeof(std::int16_t);

    const int status = vosk_recognizer_accept_waveform(recognizer_.get(), chunk.data(),
                                                       static_cast<int>(chunk.size()));
    samplesProcessed_ += static_cast<std::int64_t>(count);
    emitAudioLevel(samples, count);

    if (status < 0) {
        std::cerr << "Error: Vosk rejected " << chunk.size() << " bytes of audio\n";
    } else if (status == 1) {
        finishUtterance(RecognitionResult::FinalResultEndReason::EndpointEndOfUtterance,
                        vosk_recognizer_result(recognizer_.get()));
    } else {
        const char* partial = vosk_recognizer_partial_result(recognizer_.get());
        const auto j = nlohmann::json::parse(partial ? partial : "", nullptr, false);
        if (!j.is_discarded() && j.contains("partial") && j["partial"].is_string()) {
            emitPartial(j["partial"].get<std::string>());
        }
    }

    if (config_.simulateRealtimeTestOnly && config_.sampleRate > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(
            static_cast<std::int64_t>(count) * 1000000 / config_.sampleRate));
    }
}

void VoskEngine::finishUtterance(RecognitionResult::FinalResultEndReason reason, const char* json) {
    std::vector<std::string> hypotheses;
    const auto j = nlohmann::json::parse(json ? json : "", nullptr, false);
    if (!j.is_discarded()) {
        if (j.contains("alternatives") && j["alternatives"].is_array()) {
            for (const auto& alt : j["alternatives"]) {
                if (alt.contains("text") && alt["text"].is_string()) {
                    hypotheses.push_back(alt["text"].get<std::string>());
                }
            }
        } else if (j.contains("text") && j["text"].is_string()) {
            hypotheses.push_back(j["text"].get<std::string>());
        }
    }

    lastPartial_.clear();
    const bool empty = hypotheses.empty() || hypotheses.front().empty();

    if (!empty) {
        SodaResponse response;
        response.sodaType = SodaResponse::MessageType::Recognition;
        RecognitionResult result;
        result.hypotheses = std::move(hypotheses);
        result.resultType = RecognitionResult::ResultType::Final;
        result.finalResultEndReason = reason;
        result.timingMetrics = timing();
        response.recognitionResult = std::move(result);
        emit(response);
    }

    SodaResponse endpoint;
    endpoint.sodaType = SodaResponse::MessageType::Endpoint;
    EndpointEvent event;
    event.endpointType = (reason == RecognitionResult::FinalResultEndReason::EndpointEndOfAudio)
                             ? EndpointEvent::EndpointType::EndOfAudio
                             : EndpointEvent::EndpointType::EndOfUtterance;
    event.timingMetrics = timing();
    endpoint.endpointEvent = std::move(event);
    emit(endpoint);

    utteranceStartUsec_ = audioTimeUsec();
}

void VoskEngine::emitPartial(const std::string& text) {
    if (text.empty() || text == lastPartial_) return;
    lastPartial_ = text;

    SodaResponse response;
    response.sodaType = SodaResponse::MessageType::Recognition;
    RecognitionResult result;
    result.hypotheses.push_back(text);
    result.resultType = RecognitionResult::ResultType::Partial;
    result.timingMetrics = timing();
    response.recognitionResult = std::move(result);
    emit(response);
}

void VoskEngine::emitAudioLevel(const std::int16_t* samples, std::size_t count) {
    const float rms = compute_rms(samples, count);

    SodaResponse response;
    response.sodaType = SodaResponse::MessageType::AudioLevel;
    AudioLevelInfo info;
    info.rms = rms;
    info.audioLevel = rms_to_level(rms);
    info.audioTimeUsec = audioTimeUsec();
    response.audioLevelInfo = info;
    emit(response);
}

void VoskEngine::emit(const SodaResponse& response) {
    if (!callback_) return;
    const std::vector<char> payload = encodeResponse(response);
    callback_(payload.data(), static_cast<int>(payload.size()), callbackHandle_);
}

std::optional<TimingMetrics> VoskEngine::timing() const {
    if (!config_.includeTimingMetrics) return std::nullopt;
    TimingMetrics t;
    t.audioStartEpochUsec = audioStartEpochUsec_;
    t.audioStartTimeUsec = utteranceStartUsec_;
    t.elapsedWallTimeUsec = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now() - audioStart_).count();
    t.eventEndTimeUsec = audioTimeUsec();
    return t;
}

std::int64_t VoskEngine::audioTimeUsec() const {
    if (config_.sampleRate <= 0) return 0;
    return samplesProcessed_ * 1000000 / config_.sampleRate;
}

void* createVoskEngine(SerializedSodaConfig raw) {
    if (raw.soda_config_size < 0) return nullptr;
    auto config = decodeConfig(raw.soda_config, static_cast<std::size_t>(raw.soda_config_size));
    if (!config) {
        std::cerr << "Error: Vosk engine received an unreadable config\n";
        return nullptr;
    }
    if (config->channelCount != 1) {
        std::cerr << "Error: Vosk engine only accepts mono audio, got "
                  << config->channelCount << " channels\n";
        return nullptr;
    }

    try {
        auto engine = std::make_unique<VoskEngine>(*config, raw.callback, raw.callback_handle);
        if (!engine->init()) return nullptr;
        SODA_DEBUG_LOG("created Vosk engine for " << config->languagePackDirectory);
        return engine.release();
    } catch (const std::exception& e) {
        std::cerr << "Error: Vosk engine creation failed: " << e.what() << "\n";
        return nullptr;
    }
}

void deleteVoskEngine(void* handle) {
    delete static_cast<VoskEngine*>(handle);
}

void voskEngineAddAudio(void* handle, const char* data, int size) {
    try {
        static_cast<VoskEngine*>(handle)->addAudio(data, size);
    } catch (const std::exception& e) {
        std::cerr << "Error: Vosk engine dropped audio: " << e.what() << "\n";
    }
}

void voskEngineStart(void* handle) {
    try {
        static_cast<VoskEngine*>(handle)->start();
    } catch (const std::exception& e) {
        std::cerr << "Error: Vosk engine failed to start: " << e.what() << "\n";
    }
}

} // namespace

EngineApiPtr voskEngineApi() {
    static const EngineApiPtr api = [] {
        auto table = std::make_shared<EngineApi>();
        table->name = "vosk";
        table->createExtended = &createVoskEngine;
        table->deleteExtended = &deleteVoskEngine;
        table->extendedAddAudio = &voskEngineAddAudio;
        table->extendedStart = &voskEngineStart;
        return EngineApiPtr(std::move(table));
    }();
    return api;
}

} // namespace soda
