#include "engine/engine_library.hpp"

#include "common/debug_log.hpp"
#include "common/error.hpp"

#include <dlfcn.h>
#include <cstdlib>
#include <iostream>

namespace soda {

namespace {

struct LoadedLibrary {
    void* handle{nullptr};
    EngineApi api;

    ~LoadedLibrary() {
        if (handle) dlclose(handle);
    }
};

template <typename Fn>
void resolve(void* handle, const char* symbol, Fn& field) {
    field = reinterpret_cast<Fn>(dlsym(handle, symbol));
}

} // namespace

std::string EngineLibrary::defaultPath() {
    const char* env = std::getenv(LIBRARY_PATH_ENV);
    if (env && *env) return env;
    return DEFAULT_LIBRARY_PATH;
}

EngineApiPtr EngineLibrary::load(const std::string& path) {
    auto library = std::make_shared<LoadedLibrary>();

    library->handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!library->handle) {
        const char* error = dlerror();
        throw SodaError(SodaError::Kind::LibraryLoad,
                        "Unable to load engine library " + path + ": " +
                        (error ? error : "unknown error"));
    }

    EngineApi& api = library->api;
    api.name = path;
    resolve(library->handle, "CreateSodaAsync", api.createSoda);
    resolve(library->handle, "DeleteSodaAsync", api.deleteSoda);
    resolve(library->handle, "AddAudio", api.addAudio);
    resolve(library->handle, "CreateExtendedSodaAsync", api.createExtended);
    resolve(library->handle, "DeleteExtendedSodaAsync", api.deleteExtended);
    resolve(library->handle, "ExtendedAddAudio", api.extendedAddAudio);
    resolve(library->handle, "ExtendedSodaStart", api.extendedStart);

    if (!api.hasSimpleInterface() && !api.hasExtendedInterface()) {
        throw SodaError(SodaError::Kind::LibraryLoad,
                        "Missing engine entry points in " + path);
    }
    if (!api.hasExtendedInterface()) {
        std::cerr << "Warning: " << path << " only provides the plain-text interface\n";
    }

    SODA_DEBUG_LOG("loaded engine library " << path);
    return EngineApiPtr(library, &library->api);
}

} // namespace soda
