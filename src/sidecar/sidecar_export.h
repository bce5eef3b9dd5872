#pragma once

#ifdef _WIN32
    #ifdef SIDECAR_BUILDING_DLL
        #define SIDECAR_API __declspec(dllexport)
    #else
        #define SIDECAR_API __declspec(dllimport)
    #endif
#else
    #define SIDECAR_API
#endif
