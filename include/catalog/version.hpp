#pragma once

#define CATALOG_VERSION_MAJOR 1
#define CATALOG_VERSION_MINOR 0
#define CATALOG_VERSION_PATCH 0

#define CATALOG_VERSION_STRING "1.0.0"

// For compile-time version checks
#define CATALOG_VERSION \
  (CATALOG_VERSION_MAJOR * 10000 + CATALOG_VERSION_MINOR * 100 + CATALOG_VERSION_PATCH)

namespace catalog {

inline const char* Version() { return CATALOG_VERSION_STRING; }

}  // namespace catalog
