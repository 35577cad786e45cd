#pragma once

#if defined(_WIN32)
    #if defined(COMMPUTE_EXPORT)
        #define COMMPUTE_API __declspec(dllexport)
    #else
        #define COMMPUTE_API __declspec(dllimport)
    #endif
#else
    #define COMMPUTE_API __attribute__((visibility("default")))
#endif
