#pragma once

#include <cstdio>

#ifndef PAINTCORE_ENABLE_LOGGING
#define PAINTCORE_ENABLE_LOGGING 0
#endif

#if PAINTCORE_ENABLE_LOGGING
#define PAINTCORE_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[paintcore] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define PAINTCORE_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[paintcore:warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define PAINTCORE_LOG_DEBUG(...) do { } while (0)
#define PAINTCORE_LOG_WARN(...) do { } while (0)
#endif
