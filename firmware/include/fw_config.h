#pragma once

// ============================
// Firmware Version Definition
// ============================

#define FW_NAME "bargraph-meter"

// Major version number (increment on console protocol changes)
#define FW_VERSION_MAJOR 1

// Minor version (add new commands or meter features)
#define FW_VERSION_MINOR 2

// Patch version (bug fixes)
#define FW_VERSION_PATCH 0

#define STR_HELPER(x) #x
#define STR(x) STR_HELPER(x)

#define FW_VERSION_STRING  \
    STR(FW_VERSION_MAJOR) "." STR(FW_VERSION_MINOR) "." STR(FW_VERSION_PATCH)


// ============================
// Build Metadata
// ============================

#define FW_BUILD_DATE __DATE__
#define FW_BUILD_TIME __TIME__

// Injected by the build (-DFW_BUILD_HASH=\"abc123\")
#ifndef FW_BUILD_HASH
#define FW_BUILD_HASH "dev"
#endif
