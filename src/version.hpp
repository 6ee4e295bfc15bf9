#pragma once

// Build/version info.
//
// CMake defines PROCMAPS_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef PROCMAPS_VERSION
#define PROCMAPS_VERSION "dev"
#endif

#ifndef PROCMAPS_APPNAME
#define PROCMAPS_APPNAME "procmaps"
#endif
