#pragma once

#include "client/simple_soda_client.hpp"
#include "client/soda_client.hpp"
#include "config/soda_config.hpp"
#include "engine/engine_api.hpp"

#include <string>

namespace soda {

// Collects recognition parameters and creates clients from them. Setters do
// not validate; out-of-range values are left for the engine to reject.
// build() leaves the builder untouched, so one builder can create several
// independent clients, each with its own callback.
class SodaBuilder {
public:
    SodaBuilder() = default;

    SodaBuilder& channelCount(int channelCount);
    SodaBuilder& sampleRate(int sampleRate);
    SodaBuilder& languagePackDirectory(std::string directory);
    SodaBuilder& apiKey(std::string apiKey);
    SodaBuilder& recognitionMode(RecognitionMode mode);
    SodaBuilder& maxBufferBytes(int maxBufferBytes);
    SodaBuilder& simulateRealtimeTestOnly(bool enabled);
    SodaBuilder& resetOnFinalResult(bool enabled);
    SodaBuilder& includeTimingMetrics(bool enabled);
    SodaBuilder& enableLangId(bool enabled);

    // Without an engine, build loads EngineLibrary::defaultPath() once.
    SodaBuilder& engine(EngineApiPtr engine);

    const Config& config() const { return config_; }

    // Throw SodaError if the engine cannot be loaded, the config cannot be
    // encoded or the engine refuses to create an instance.
    SodaClient build(SodaClient::Callback callback);
    SimpleSodaClient buildSimple(SimpleSodaClient::Callback callback);

private:
    EngineApiPtr resolveEngine();

    Config config_;
    EngineApiPtr engine_;
};

} // namespace soda
