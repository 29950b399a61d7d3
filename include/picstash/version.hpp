#pragma once

#define PICSTASH_VERSION_MAJOR 0
#define PICSTASH_VERSION_MINOR 1
#define PICSTASH_VERSION_PATCH 0

#define PICSTASH_VERSION_STRING "0.1.0"

// For compile-time version checks
#define PICSTASH_VERSION \
  (PICSTASH_VERSION_MAJOR * 10000 + PICSTASH_VERSION_MINOR * 100 + PICSTASH_VERSION_PATCH)

namespace picstash {

inline const char* Version() { return PICSTASH_VERSION_STRING; }

}  // namespace picstash
