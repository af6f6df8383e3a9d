#pragma once

#include "audio/audio_feeder.hpp"
#include "audio/audio_sink.hpp"
#include "client/callback_box.hpp"
#include "config/soda_config.hpp"
#include "engine/engine_api.hpp"
#include "recognition/soda_response.hpp"

#include <functional>
#include <istream>
#include <memory>

namespace soda {

// Client over the serialized interface. Results arrive as SodaResponse
// values on engine threads, possibly concurrently.
class SodaClient : public AudioSink {
public:
    using Callback = std::function<void(const SodaResponse&)>;

    enum class State {
        Started,
        Destroyed
    };

    // Creates and starts one engine instance. Throws SodaError on failure.
    SodaClient(EngineApiPtr engine, const Config& config, Callback callback);
    ~SodaClient() override;

    SodaClient(SodaClient&& other) noexcept;
    SodaClient& operator=(SodaClient&& other) noexcept;
    SodaClient(const SodaClient&) = delete;
    SodaClient& operator=(const SodaClient&) = delete;

    void pushAudio(const char* data, int size) override;

    FeedResult addAudio(std::istream& source, const Pacer& pacer = Pacer::immediate());

    // Paces the stream like live capture; the engine needs streamed audio
    // to produce events.
    FeedResult addSimulatedAudio(std::istream& source);

    // Stops callbacks and destroys the engine instance. Called by the
    // destructor; safe to call more than once.
    void close();

    State state() const { return engine_ ? State::Started : State::Destroyed; }

private:
    using Box = CallbackBox<const SodaResponse&>;

    static void onResult(const char* payload, int length, void* userData) noexcept;

    std::unique_ptr<Box> callback_;
    EngineHandle engine_;
};

} // namespace soda
