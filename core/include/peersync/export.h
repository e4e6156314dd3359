#pragma once

#if defined(_WIN32) && !defined(PEERSYNC_STATIC)
    #ifdef PEERSYNC_EXPORTS
        #define PS_API __declspec(dllexport)
    #else
        #define PS_API __declspec(dllimport)
    #endif
#elif defined(_WIN32)
    #define PS_API
#else
    #define PS_API __attribute__((visibility("default")))
#endif
