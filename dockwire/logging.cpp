//
// Created by dc on 10/11/18.
//

#include <unistd.h>

#include <algorithm>
#include <cstdio>

#include "logging.h"

namespace dockwire {

    static log::__Logger SYS_LOGGER;
    log::__Logger& __Log = SYS_LOGGER;

    namespace log {

        static const char *LEVEL_NAMES[] = {
                "TRC", "DBG", "INF", "NTC", "WRN", "ERR", "CRT"
        };

        // ANSI colour for each level, indexed like LEVEL_NAMES
        static const char *LEVEL_COLOURS[] = {
                nullptr, "\033[35m", nullptr, "\033[1;32m", "\033[33m", "\033[31m", "\033[1;31m"
        };

        size_t Formatter::operator()(
                char *out,
                Level l,
                const char *tag,
                const char *fmt,
                va_list args)
        {
            size_t sz = DOCKWIRE_LOG_BUFFER_SIZE - 2;
            const char *name = __Log.app_name()? __Log.app_name() : "dockwire";

            int wr = snprintf(out, sz, "%s/%05d: [%s] [%3s] [%10.10s] ",
                              name, getpid(), Datetime()(), LEVEL_NAMES[(unsigned char) l], tag);
            if (wr < 0 || (size_t) wr >= sz) {
                return 0;
            }

            sz -= wr;
            int nwr = vsnprintf(out + wr, sz, fmt, args);
            if (nwr < 0) {
                return 0;
            }
            wr += std::min((size_t) nwr, sz - 1);
            out[wr++] = '\n';
            out[wr]   = '\0';

            return (size_t) wr;
        }

        void Handler::operator()(const char *log, size_t sz, Level l) {
            static const bool tty = isatty(STDERR_FILENO) == 1;
            const char *colour = tty? LEVEL_COLOURS[(unsigned char) l] : nullptr;
            if (colour) {
                fprintf(stderr, "%s%.*s\033[0m", colour, (int) sz, log);
            }
            else {
                fwrite(log, 1, sz, stderr);
            }
        }
    }
}
