#pragma once
#ifndef JSONSTREAM_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define JSONSTREAM_PLATFORM_WINDOWS 1
#else
#define JSONSTREAM_PLATFORM_WINDOWS 0
#endif
#if JSONSTREAM_PLATFORM_WINDOWS
#if defined(JSONSTREAM_BUILD_SHARED)
#define JSONSTREAM_API __declspec(dllexport)
#elif defined(JSONSTREAM_SHARED)
#define JSONSTREAM_API __declspec(dllimport)
#else
#define JSONSTREAM_API
#endif
#else
#if defined(JSONSTREAM_BUILD_SHARED) || defined(JSONSTREAM_SHARED)
#if __GNUC__ >= 4
#define JSONSTREAM_API __attribute__((visibility("default")))
#else
#define JSONSTREAM_API
#endif // __GNUC__
#else
#define JSONSTREAM_API
#endif // JSONSTREAM_BUILD_SHARED || JSONSTREAM_SHARED
#endif // JSONSTREAM_PLATFORM_WINDOWS
#endif // JSONSTREAM_API
