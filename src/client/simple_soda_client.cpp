#include "client/simple_soda_client.hpp"

#include "common/debug_log.hpp"
#include "common/error.hpp"
#include "common/utf8.hpp"
#include "config/config_codec.hpp"

#include <iostream>

namespace soda {

SimpleSodaClient::SimpleSodaClient(EngineApiPtr engine, const Config& config, Callback callback) {
    if (!engine || !engine->hasSimpleInterface()) {
        throw SodaError(SodaError::Kind::Creation,
                        "Engine does not provide the plain-text interface");
    }

    // Strings borrowed by the raw struct live until the end of this scope.
    FlatConfigRecord record(config);
    callback_ = std::make_unique<Box>(std::move(callback));

    void* instance = engine->createSoda(record.toRaw(&SimpleSodaClient::onResult,
                                                     callback_->userData()));
    if (!instance) {
        throw SodaError(SodaError::Kind::Creation,
                        "Engine " + engine->name + " failed to create an instance");
    }

    const auto destroy = engine->deleteSoda;
    const auto addAudio = engine->addAudio;
    engine_ = EngineHandle(std::move(engine), instance, destroy, addAudio);
    SODA_DEBUG_LOG("created plain-text engine instance " << instance);
}

SimpleSodaClient::~SimpleSodaClient() {
    close();
}

SimpleSodaClient::SimpleSodaClient(SimpleSodaClient&& other) noexcept
    : callback_(std::move(other.callback_)),
      engine_(std::move(other.engine_)) {
}

SimpleSodaClient& SimpleSodaClient::operator=(SimpleSodaClient&& other) noexcept {
    if (this != &other) {
        close();
        callback_ = std::move(other.callback_);
        engine_ = std::move(other.engine_);
    }
    return *this;
}

void SimpleSodaClient::close() {
    if (callback_) callback_->close();
    engine_.reset();
    callback_.reset();
}

void SimpleSodaClient::pushAudio(const char* data, int size) {
    engine_.pushAudio(data, size);
}

FeedResult SimpleSodaClient::addAudio(std::istream& source, const Pacer& pacer) {
    AudioFeeder feeder(*this, pacer);
    return feeder.feed(source);
}

FeedResult SimpleSodaClient::addSimulatedAudio(std::istream& source) {
    return addAudio(source, Pacer::realtime());
}

void SimpleSodaClient::onResult(const char* text, const bool isFinal, void* userData) noexcept {
    auto* box = Box::fromUserData(userData);
    if (!box) return;

    try {
        box->invoke(utf8::toLossy(text), isFinal);
    } catch (const std::exception& e) {
        std::cerr << "Error: recognition callback threw: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Error: recognition callback threw a non-standard exception" << std::endl;
    }
}

} // namespace soda
