#include "client/soda_builder.hpp"

#include "engine/engine_library.hpp"

namespace soda {

SodaBuilder& SodaBuilder::channelCount(int channelCount) {
    config_.channelCount = channelCount;
    return *this;
}

SodaBuilder& SodaBuilder::sampleRate(int sampleRate) {
    config_.sampleRate = sampleRate;
    return *this;
}

SodaBuilder& SodaBuilder::languagePackDirectory(std::string directory) {
    config_.languagePackDirectory = std::move(directory);
    return *this;
}

SodaBuilder& SodaBuilder::apiKey(std::string apiKey) {
    config_.apiKey = std::move(apiKey);
    return *this;
}

SodaBuilder& SodaBuilder::recognitionMode(RecognitionMode mode) {
    config_.recognitionMode = mode;
    return *this;
}

SodaBuilder& SodaBuilder::maxBufferBytes(int maxBufferBytes) {
    config_.maxBufferBytes = maxBufferBytes;
    return *this;
}

SodaBuilder& SodaBuilder::simulateRealtimeTestOnly(bool enabled) {
    config_.simulateRealtimeTestOnly = enabled;
    return *this;
}

SodaBuilder& SodaBuilder::resetOnFinalResult(bool enabled) {
    config_.resetOnFinalResult = enabled;
    return *this;
}

SodaBuilder& SodaBuilder::includeTimingMetrics(bool enabled) {
    config_.includeTimingMetrics = enabled;
    return *this;
}

SodaBuilder& SodaBuilder::enableLangId(bool enabled) {
    config_.enableLangId = enabled;
    return *this;
}

SodaBuilder& SodaBuilder::engine(EngineApiPtr engine) {
    engine_ = std::move(engine);
    return *this;
}

EngineApiPtr SodaBuilder::resolveEngine() {
    if (!engine_) {
        engine_ = EngineLibrary::load(EngineLibrary::defaultPath());
    }
    return engine_;
}

SodaClient SodaBuilder::build(SodaClient::Callback callback) {
    return SodaClient(resolveEngine(), config_, std::move(callback));
}

SimpleSodaClient SodaBuilder::buildSimple(SimpleSodaClient::Callback callback) {
    return SimpleSodaClient(resolveEngine(), config_, std::move(callback));
}

} // namespace soda
