/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_VERSION_H
#define TRUSTGEN_VERSION_H

#if defined(_WIN32) || defined(__CYGWIN__)
#  if defined(TRUSTGEN_API_BUILDING)
#    define TRUSTGEN_API __declspec(dllexport)
#  else
#    define TRUSTGEN_API __declspec(dllimport)
#  endif
#elif defined(__GNUC__)
#  define TRUSTGEN_API __attribute__((visibility("default")))
#else
#  define TRUSTGEN_API
#endif

#define TRUSTGEN_MAJOR_VERSION 1
#define TRUSTGEN_MINOR_VERSION 0
#define TRUSTGEN_MAINTENANCE_VERSION 0

#define TRUSTGEN_VERSION_INT(V,R,M) ((unsigned long)((V)<<16u | (R)<<8u | (M)))

#define TRUSTGEN_VERSION TRUSTGEN_VERSION_INT(TRUSTGEN_MAJOR_VERSION, TRUSTGEN_MINOR_VERSION, TRUSTGEN_MAINTENANCE_VERSION)

namespace trustgen {

//! Library version as a string.  eg. "trustgen 1.0.0 (OpenSSL 3.0.13 30 Jan 2024)"
TRUSTGEN_API
const char *version_str();

//! Library version as an integer.  cf. TRUSTGEN_VERSION_INT()
TRUSTGEN_API
unsigned long version_int();

} // namespace trustgen

#endif // TRUSTGEN_VERSION_H
