#pragma once

#if defined(DOTENV_SHARED)
    #if defined(_MSC_VER)
        #if defined(DOTENV_BUILDING)
            #define DOTENV_API __declspec(dllexport)
        #else
            #define DOTENV_API __declspec(dllimport)
        #endif
    #elif defined(__GNUC__) || defined(__clang__)
        #if defined(DOTENV_BUILDING)
            #define DOTENV_API __attribute__((visibility("default")))
        #else
            #define DOTENV_API
        #endif
    #else
        #define DOTENV_API
    #endif
#else
    #define DOTENV_API
#endif
