#pragma once

#if defined(_WIN32)
    #if defined(LEXICORE_EXPORT)
        #define LEXICORE_API __declspec(dllexport)
    #else
        #define LEXICORE_API __declspec(dllimport)
    #endif
#else
    #define LEXICORE_API __attribute__((visibility("default")))
#endif
