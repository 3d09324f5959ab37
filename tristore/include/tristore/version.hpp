#pragma once

#define TRISTORE_VERSION "0.4.0"
#define TRISTORE_VERSION_MAJOR 0
#define TRISTORE_VERSION_MINOR 4

namespace tristore {
namespace version {

inline const char* string() { return TRISTORE_VERSION; }

} // namespace version
} // namespace tristore
