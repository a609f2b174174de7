#ifndef MAINTBRANCH_VERSION_HPP
#define MAINTBRANCH_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros (safe for .rc files)               */
#define MAINTBRANCH_VERSION_MAJOR 1
#define MAINTBRANCH_VERSION_MINOR 0
#define MAINTBRANCH_VERSION_PATCH 0

#define MAINTBRANCH_VERSION_STR "1.0.0"
#define MAINTBRANCH_VERSION_RC                                                                     \
    MAINTBRANCH_VERSION_MAJOR, MAINTBRANCH_VERSION_MINOR, MAINTBRANCH_VERSION_PATCH, 0
/* ------------------------------------------------------------------ */

/* Everything below is **C++-only**.  Keep it out of windres runs.   */
#ifndef RC_INVOKED
constexpr const char* MAINTBRANCH_VERSION = MAINTBRANCH_VERSION_STR;
#endif /* RC_INVOKED */

#endif /* MAINTBRANCH_VERSION_HPP */
