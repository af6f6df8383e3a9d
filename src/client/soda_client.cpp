#include "client/soda_client.hpp"

#include "common/debug_log.hpp"
#include "common/error.hpp"
#include "config/config_codec.hpp"
#include "recognition/response_codec.hpp"

#include <iostream>
#include <limits>

namespace soda {

SodaClient::SodaClient(EngineApiPtr engine, const Config& config, Callback callback) {
    if (!engine || !engine->hasExtendedInterface()) {
        throw SodaError(SodaError::Kind::Creation,
                        "Engine does not provide the serialized interface");
    }

    const std::vector<char> encoded = encodeConfig(config);
    if (encoded.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw SodaError(SodaError::Kind::Serialization, "Encoded config too large");
    }

    callback_ = std::make_unique<Box>(std::move(callback));

    SerializedSodaConfig raw{};
    raw.soda_config = encoded.data();
    raw.soda_config_size = static_cast<int>(encoded.size());
    raw.callback = &SodaClient::onResult;
    raw.callback_handle = callback_->userData();

    void* instance = engine->createExtended(raw);
    if (!instance) {
        throw SodaError(SodaError::Kind::Creation,
                        "Engine " + engine->name + " failed to create an instance");
    }

    const auto destroy = engine->deleteExtended;
    const auto addAudio = engine->extendedAddAudio;
    const auto start = engine->extendedStart;
    engine_ = EngineHandle(std::move(engine), instance, destroy, addAudio);

    start(engine_.get());
    SODA_DEBUG_LOG("started engine instance " << instance);
}

SodaClient::~SodaClient() {
    close();
}

SodaClient::SodaClient(SodaClient&& other) noexcept
    : callback_(std::move(other.callback_)),
      engine_(std::move(other.engine_)) {
}

SodaClient& SodaClient::operator=(SodaClient&& other) noexcept {
    if (this != &other) {
        close();
        callback_ = std::move(other.callback_);
        engine_ = std::move(other.engine_);
    }
    return *this;
}

void SodaClient::close() {
    // Callbacks are shut off first so none reaches user code while the
    // engine winds down, then the box is freed once destroy has returned.
    if (callback_) callback_->close();
    engine_.reset();
    callback_.reset();
}

void SodaClient::pushAudio(const char* data, int size) {
    engine_.pushAudio(data, size);
}

FeedResult SodaClient::addAudio(std::istream& source, const Pacer& pacer) {
    AudioFeeder feeder(*this, pacer);
    return feeder.feed(source);
}

FeedResult SodaClient::addSimulatedAudio(std::istream& source) {
    return addAudio(source, Pacer::realtime());
}

void SodaClient::onResult(const char* payload, int length, void* userData) noexcept {
    auto* box = Box::fromUserData(userData);
    if (!box || length < 0) return;

    try {
        auto response = decodeResponse(payload, static_cast<std::size_t>(length));
        if (!response) return;
        box->invoke(*response);
    } catch (const std::exception& e) {
        std::cerr << "Error: recognition callback threw: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Error: recognition callback threw a non-standard exception" << std::endl;
    }
}

} // namespace soda
