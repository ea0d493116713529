#pragma once

// ------------------------------------------------------------
// build_info.hpp
// Fallbacks for the version fingerprint. CMakeLists.txt injects the real
// values with target_compile_definitions.
// ------------------------------------------------------------

#ifndef CFL_VERSION_STR
#define CFL_VERSION_STR "Unknown"
#endif

#ifndef CFL_BUILD_TYPE_STR
#define CFL_BUILD_TYPE_STR "Unknown"
#endif

#ifndef CFL_COMPILER_ID_STR
#define CFL_COMPILER_ID_STR "Unknown"
#endif

#ifndef CFL_COMPILER_VERSION_STR
#define CFL_COMPILER_VERSION_STR "Unknown"
#endif

#ifndef CFL_QT_BUILD_VERSION_STR
#define CFL_QT_BUILD_VERSION_STR "Unknown"
#endif
