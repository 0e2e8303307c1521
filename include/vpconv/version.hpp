#pragma once

#include <string>

namespace vpconv {

// Project version string as defined by CMake's project(VERSION ...).
//
// CMake defines VPCONV_VERSION_STRING for all targets that link against the
// vpconv library.
#ifndef VPCONV_VERSION_STRING
  #define VPCONV_VERSION_STRING "0.0.0"
#endif

inline const char* version_cstr() {
  return VPCONV_VERSION_STRING;
}

inline std::string version_string() {
  return std::string(version_cstr());
}

// Tool name and version, e.g. "vpconv 1.0.0". Used in EDF recording ids and
// sidecar notes.
inline std::string software_tag() {
  return std::string("vpconv ") + version_cstr();
}

} // namespace vpconv
