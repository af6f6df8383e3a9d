#pragma once

#include "engine/engine_api.hpp"

#include <string>

namespace soda {

// Resolves the engine's C entry points from a shared library at runtime.
class EngineLibrary {
public:
    static constexpr const char* DEFAULT_LIBRARY_PATH = "./SODAFiles/libsoda.so";
    static constexpr const char* LIBRARY_PATH_ENV = "SODA_LIBRARY_PATH";

    // $SODA_LIBRARY_PATH if set, otherwise DEFAULT_LIBRARY_PATH.
    static std::string defaultPath();

    // Throws SodaError(LibraryLoad) when the library cannot be opened or
    // exposes neither interface completely. The returned table keeps the
    // library mapped for as long as it is referenced.
    static EngineApiPtr load(const std::string& path);
};

} // namespace soda
