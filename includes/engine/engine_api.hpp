#pragma once

#include "engine/soda_api.h"

#include <memory>
#include <string>

namespace soda {

// Entry points of one engine implementation. A table may provide either
// generation of the interface or both.
struct EngineApi {
    std::string name;

    CreateSodaAsyncFn createSoda{nullptr};
    DeleteSodaAsyncFn deleteSoda{nullptr};
    AddAudioFn addAudio{nullptr};

    CreateExtendedSodaAsyncFn createExtended{nullptr};
    DeleteExtendedSodaAsyncFn deleteExtended{nullptr};
    ExtendedAddAudioFn extendedAddAudio{nullptr};
    ExtendedSodaStartFn extendedStart{nullptr};

    bool hasSimpleInterface() const {
        return createSoda && deleteSoda && addAudio;
    }
    bool hasExtendedInterface() const {
        return createExtended && deleteExtended && extendedAddAudio && extendedStart;
    }
};

// Shared so that a loaded library outlives every instance created from it.
using EngineApiPtr = std::shared_ptr<const EngineApi>;

// Sole owner of one opaque engine instance. The destroy entry point runs
// exactly once, when the handle is reset or destroyed.
class EngineHandle {
public:
    using AddAudioEntry = void (*)(void*, const char*, int);

    EngineHandle() : instance_(nullptr, InstanceDeleter{nullptr}) {}
    EngineHandle(EngineApiPtr api, void* instance,
                 DeleteSodaAsyncFn destroy, AddAudioEntry addAudio);

    EngineHandle(EngineHandle&&) noexcept = default;
    EngineHandle& operator=(EngineHandle&& other) noexcept;
    EngineHandle(const EngineHandle&) = delete;
    EngineHandle& operator=(const EngineHandle&) = delete;

    // Blocks until the engine has quiesced its callbacks.
    void reset();

    void pushAudio(const char* data, int size);

    void* get() const { return instance_.get(); }
    explicit operator bool() const { return static_cast<bool>(instance_); }
    const EngineApi& api() const { return *api_; }

private:
    struct InstanceDeleter {
        DeleteSodaAsyncFn destroy;
        void operator()(void* p) const { if (p && destroy) destroy(p); }
    };

    // Declared first so the library stays loaded until the instance is gone.
    EngineApiPtr api_;
    std::unique_ptr<void, InstanceDeleter> instance_;
    AddAudioEntry addAudio_{nullptr};
};

} // namespace soda
