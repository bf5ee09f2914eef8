#pragma once

#include <cstdio>

#ifndef ATLAS_ENABLE_LOGGING
#define ATLAS_ENABLE_LOGGING 0
#endif

#if ATLAS_ENABLE_LOGGING
#define ATLAS_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[atlas] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define ATLAS_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[atlas] warning: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define ATLAS_LOG_DEBUG(...) do { } while (0)
#define ATLAS_LOG_WARN(...) do { } while (0)
#endif
