#pragma once

#include "audio/audio_feeder.hpp"
#include "audio/audio_sink.hpp"
#include "client/callback_box.hpp"
#include "config/soda_config.hpp"
#include "engine/engine_api.hpp"

#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace soda {

// Client over the fixed-layout interface: results are plain text plus a
// finality flag. Only channel count, sample rate, language pack and API key
// of the config reach the engine.
class SimpleSodaClient : public AudioSink {
public:
    using Callback = std::function<void(const std::string& text, bool isFinal)>;

    SimpleSodaClient(EngineApiPtr engine, const Config& config, Callback callback);
    ~SimpleSodaClient() override;

    SimpleSodaClient(SimpleSodaClient&& other) noexcept;
    SimpleSodaClient& operator=(SimpleSodaClient&& other) noexcept;
    SimpleSodaClient(const SimpleSodaClient&) = delete;
    SimpleSodaClient& operator=(const SimpleSodaClient&) = delete;

    void pushAudio(const char* data, int size) override;

    FeedResult addAudio(std::istream& source, const Pacer& pacer = Pacer::immediate());
    FeedResult addSimulatedAudio(std::istream& source);

    void close();
    bool isOpen() const { return static_cast<bool>(engine_); }

private:
    using Box = CallbackBox<const std::string&, bool>;

    static void onResult(const char* text, const bool isFinal, void* userData) noexcept;

    std::unique_ptr<Box> callback_;
    EngineHandle engine_;
};

} // namespace soda
