#pragma once
/**
 * @file core.hpp
 * @brief Core library version and export macros for keycast.
 *
 * This header defines library version information and symbol export macros
 * used throughout the keycast library.
 *
 * For the key model (Key, MouseButton, keyToString) include
 * `<keycast/input/key.hpp>` instead.
 */

#ifndef KEYCAST_VERSION
// Default version; CMake overrides these by defining KEYCAST_VERSION_* via
// -D flags.
#define KEYCAST_VERSION "0.4.0"
#define KEYCAST_VERSION_MAJOR 0
#define KEYCAST_VERSION_MINOR 4
#define KEYCAST_VERSION_PATCH 0
#endif

// Symbol visibility macro for declarations exported when keycast is built as
// a shared library (KEYCAST_BUILD_SHARED=ON).
#ifndef KEYCAST_API
#if defined(__GNUC__) && (__GNUC__ >= 4)
#define KEYCAST_API __attribute__((visibility("default")))
#else
#define KEYCAST_API
#endif
#endif

namespace keycast {

/**
 * @brief Convenience access to the library version string (mirrors
 * KEYCAST_VERSION).
 * @return const char* Null-terminated version string (statically allocated).
 */
inline const char *libraryVersion() noexcept { return KEYCAST_VERSION; }

} // namespace keycast
