#pragma once

// SHARDRENT_API marks the entry points a shared shardrent_core exports.
#if !defined(SHARDRENT_BUILD_SHARED)
#  define SHARDRENT_API
#elif defined(_WIN32) && defined(shardrent_core_EXPORTS)
#  define SHARDRENT_API __declspec(dllexport)
#elif defined(_WIN32)
#  define SHARDRENT_API __declspec(dllimport)
#else
#  define SHARDRENT_API __attribute__((visibility("default")))
#endif
