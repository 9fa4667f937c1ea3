#pragma once

/// \file export.h
/// \brief Visibility/export macros for shared library builds.

#ifdef MAPBEARING_STATIC
    #define MAPBEARING_API
#elif defined(MAPBEARING_BUILDING)
    #if defined(_MSC_VER)
        #define MAPBEARING_API __declspec(dllexport)
    #elif defined(__GNUC__) || defined(__clang__)
        #define MAPBEARING_API __attribute__((visibility("default")))
    #else
        #define MAPBEARING_API
    #endif
#else
    #if defined(_MSC_VER)
        #define MAPBEARING_API __declspec(dllimport)
    #else
        #define MAPBEARING_API
    #endif
#endif
