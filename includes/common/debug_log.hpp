#pragma once

// Per-event chatter from engine threads. Compiled out in release builds.
#ifndef NDEBUG
    #include <iostream>
    #define SODA_DEBUG_LOG(x) (std::clog << "[sodaclient] " << x << std::endl)
#else
    #define SODA_DEBUG_LOG(x) ((void)0)
#endif
