#pragma once

#ifdef _WIN32
    #ifdef TWINPANE_EXPORTS
        #define TP_API __declspec(dllexport)
    #else
        #define TP_API __declspec(dllimport)
    #endif
#else
    #define TP_API __attribute__((visibility("default")))
#endif
