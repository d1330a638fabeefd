//
// Created by dc on 09/11/18.
//

#include <dockwire/base.h>

#ifndef DOCKWIRE_MAJOR_VERSION
#define DOCKWIRE_MAJOR_VERSION 0
#endif
#ifndef DOCKWIRE_MINOR_VERSION
#define DOCKWIRE_MINOR_VERSION 1
#endif
#ifndef DOCKWIRE_PATCH_VERSION
#define DOCKWIRE_PATCH_VERSION 0
#endif
#ifndef DOCKWIRE_VERSION_STRING
#define DOCKWIRE_VERSION_STRING "0.1.0"
#endif

namespace dockwire {

    namespace version {
        const uint8_t   MAJOR{DOCKWIRE_MAJOR_VERSION};
        const uint8_t   MINOR{DOCKWIRE_MINOR_VERSION};
        const uint16_t  PATCH{DOCKWIRE_PATCH_VERSION};
        const char*     STRING{DOCKWIRE_VERSION_STRING};
        const char*     SWNAME{"dockwire"};
    }

    Datetime::Datetime()
        : m_t(time(nullptr))
    {
        gmtime_r(&m_t, &m_tm);
    }

    const char* Datetime::str(char *out, size_t sz, const char *fmt)  {
        if (!out || !sz || !fmt) {
            return nullptr;
        }
        (void) strftime(out, sz, fmt, &m_tm);
        return out;
    }
}
