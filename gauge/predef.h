#ifndef __GAUGE_PREDEF_H__
#define __GAUGE_PREDEF_H__

#include "version.h"

#ifdef LINUX
#include <sys/sysmacros.h>

#ifdef major
#undef major
#endif
#ifdef minor
#undef minor
#endif
#endif

#define stricmp strcasecmp
#define strnicmp strncasecmp

#endif
