#include "engine/engine_api.hpp"

#include "common/error.hpp"

namespace soda {

EngineHandle::EngineHandle(EngineApiPtr api, void* instance,
                           DeleteSodaAsyncFn destroy, AddAudioEntry addAudio)
    : api_(std::move(api)),
      instance_(instance, InstanceDeleter{destroy}),
      addAudio_(addAudio) {
}

EngineHandle& EngineHandle::operator=(EngineHandle&& other) noexcept {
    if (this != &other) {
        // The old instance goes away while its library is still referenced.
        instance_ = std::move(other.instance_);
        api_ = std::move(other.api_);
        addAudio_ = other.addAudio_;
        other.addAudio_ = nullptr;
    }
    return *this;
}

void EngineHandle::reset() {
    instance_.reset();
}

void EngineHandle::pushAudio(const char* data, int size) {
    if (!instance_) {
        throw SodaError(SodaError::Kind::InvalidState, "Engine instance already destroyed");
    }
    addAudio_(instance_.get(), data, size);
}

} // namespace soda
