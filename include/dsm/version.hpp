/*
 * Fallback version header for DSM
 *
 * The build system passes DSM_VERSION_* definitions on the compiler command
 * line; these defaults keep the sources compiling without them.
 */

#pragma once

#ifndef DSM_VERSION_MAJOR
#define DSM_VERSION_MAJOR 0
#endif

#ifndef DSM_VERSION_MINOR
#define DSM_VERSION_MINOR 0
#endif

#ifndef DSM_VERSION_PATCH
#define DSM_VERSION_PATCH 0
#endif

#ifndef DSM_VERSION_STRING
#define DSM_VERSION_STRING "0.0.0+dev"
#endif

#ifndef DSM_BUILD_DATE
#define DSM_BUILD_DATE __DATE__ " " __TIME__
#endif

#ifndef DSM_VERSION_LONG_STRING
#define DSM_VERSION_LONG_STRING DSM_VERSION_STRING " (built: " DSM_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace dsm {
namespace version {
constexpr int major_v = DSM_VERSION_MAJOR;
constexpr int minor_v = DSM_VERSION_MINOR;
constexpr int patch_v = DSM_VERSION_PATCH;
constexpr const char* string_v = DSM_VERSION_STRING;
constexpr const char* long_string_v = DSM_VERSION_LONG_STRING;
} // namespace version
} // namespace dsm
#endif
