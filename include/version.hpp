#ifndef SVCKIT_VERSION_HPP
#define SVCKIT_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros (safe for .rc files)               */
#define SVCKIT_VERSION_MAJOR 0
#define SVCKIT_VERSION_MINOR 3
#define SVCKIT_VERSION_PATCH 0

#define SVCKIT_VERSION_STR "0.3.0"
#define SVCKIT_VERSION_RC SVCKIT_VERSION_MAJOR, SVCKIT_VERSION_MINOR, SVCKIT_VERSION_PATCH, 0
/* ------------------------------------------------------------------ */

#ifndef RC_INVOKED
constexpr const char* SVCKIT_VERSION = SVCKIT_VERSION_STR;
#endif /* RC_INVOKED */

#endif /* SVCKIT_VERSION_HPP */
