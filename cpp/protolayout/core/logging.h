#pragma once

#include <cstdio>

#ifndef PROTOLAYOUT_ENABLE_LOGGING
#define PROTOLAYOUT_ENABLE_LOGGING 0
#endif

#if PROTOLAYOUT_ENABLE_LOGGING
#define PROTOLAYOUT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[protolayout] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define PROTOLAYOUT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[protolayout:warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define PROTOLAYOUT_LOG_DEBUG(...) do { } while (0)
#define PROTOLAYOUT_LOG_WARN(...) do { } while (0)
#endif
