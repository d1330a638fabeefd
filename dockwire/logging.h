//
// Created by dc on 10/11/18.
//

#ifndef DOCKWIRE_LOGGING_H
#define DOCKWIRE_LOGGING_H

#include <functional>

#include <iod/sio_utils.hh>

#include <dockwire/base.h>

#ifndef DOCKWIRE_LOG_BUFFER_SIZE
#define DOCKWIRE_LOG_BUFFER_SIZE (2048)
#endif

namespace dockwire {

    namespace log {

        enum Level : unsigned char {
            TRACE,
            DEBUG,
            INFO,
            NOTICE,
            WARNING,
            ERROR,
            CRITICAL
        };

        /**
         * The default log formatter, prefixes each log entry with the
         * application name, process id, time, level and the logger tag
         */
        struct Formatter {
            size_t operator()(char *out,
                              Level l,
                              const char *tag,
                              const char *fmt,
                              va_list args);
        };

        using LogFormat = std::function<size_t(char *, Level, const char *, const char*, va_list)>;

        /**
         * The default log handler, writes log entries to stderr. Entries
         * are coloured by level when stderr is a terminal
         */
        struct Handler {
            void operator()(const char *log, size_t, Level);
        };

        using LogSink = std::function<void(const char *, size_t, Level)>;

#define define_log_tag(name) \
        struct name##_log_tag {\
            static constexpr const char *TAG = #name; \
        }
#define dtag(name)   name##_log_tag

        define_log_tag(SYSTEM);

        template<class T = dtag(SYSTEM)>
        struct Logger {
            void log(Level l, const char *fmt, ...) const;
        };

        struct __Logger : public Logger<> {
            __Logger() {
                sink =
                [&](const char *msg, size_t sz, Level l) {
                    Handler()(msg, sz, l);
                };

                formatter =
                [&](char *out, Level l, const char *tag, const char *fmt, va_list args) {
                   return Formatter()(out, l, tag, fmt, args);
                };
            }

            Level getLevel() const {
                return lvl;
            }

            inline void fwdlogs(const char *log, size_t sz, Level l) {
                if (sink != nullptr) {
                    sink(log, sz, l);
                }
            }

            inline size_t format(char *out, Level l, const char *tag, const char *fmt,va_list args) {
                if (formatter != nullptr) {
                    return formatter(out, l, tag, fmt, args);
                }

                return 0;
            }

            inline const char *app_name() const {
                return appname.empty()? nullptr : appname.c_str();
            }

        private:
            template<typename... Opts>
            friend void setup(Opts...);

            LogSink     sink{nullptr};
            Level       lvl{Level::INFO};
            LogFormat   formatter{nullptr};
            std::string appname{};
        };
    }

    extern log::__Logger& __Log;

    namespace log {

        template<typename T>
        void Logger<T>::log(Level l, const char *fmt, ...) const {
            char buf[DOCKWIRE_LOG_BUFFER_SIZE];
            va_list args;
            va_start(args, fmt);
            size_t sz = __Log.format(buf, l, T::TAG, fmt, args);
            va_end(args);

            if (sz > 0) {
                __Log.fwdlogs(buf, sz, l);
            }
        }

        /**
         * configure the global logger
         *
         * @param opts iod options, any of verbose (0 is CRITICAL only,
         * 6 is everything), logsink, logformat and name
         *
         * @code
         * log::setup(opt(verbose, 2), opt(name, "dockwire"));
         * @endcode
         */
        template<typename... Opts>
        void setup(Opts... opts) {
            auto options = iod::D(opts...);

            int l = options.get(var(verbose), -1);
            if (l >= 0) {
                /* set log level */
                Level lvl;
                if (l > (uint8_t) Level::CRITICAL) {
                    /* invalid log level */
                    lvl = Level::TRACE;
                } else {
                    lvl = (Level) ((uint8_t) Level::CRITICAL - l);
                }
                __Log.lvl = lvl;
            }

            LogSink sink = options.get(var(logsink), nullptr);
            if (sink != nullptr) {
                /* set log sink */
                __Log.sink = std::move(sink);
            }

            LogFormat fmt = options.get(var(logformat), nullptr);
            if (fmt != nullptr) {
                /* set log formatter */
                __Log.formatter = std::move(fmt);
            }

            const char *name = options.get(var(name), nullptr);
            if (name) {
                __Log.appname = name;
            }
        }
    }

}

#define LOGGER(...) dockwire::log::Logger< dtag(__VA_ARGS__) >
#define __LOG(sub, l, fmt, ...)                                 \
    if (dockwire::__Log.getLevel() <= (dockwire::log::Level:: l))       \
        (sub)->log(dockwire::log::Level:: l , fmt , ##__VA_ARGS__)

#define ldebug(sub, fmt, ...)    __LOG(sub, DEBUG, fmt, ##__VA_ARGS__)
#define idebug(fmt, ...)         __LOG(this, DEBUG, fmt, ##__VA_ARGS__)
#define sdebug(fmt, ...)         __LOG(&dockwire::__Log, DEBUG, fmt, ##__VA_ARGS__)
#define lwarn(sub, fmt, ...)     __LOG(sub, WARNING, fmt, ##__VA_ARGS__)
#define iwarn(fmt, ...)          __LOG(this, WARNING, fmt, ##__VA_ARGS__)
#define swarn(fmt, ...)          __LOG(&dockwire::__Log, WARNING, fmt, ##__VA_ARGS__)
#define linfo(sub, fmt, ...)     __LOG(sub, INFO, fmt, ##__VA_ARGS__)
#define iinfo(fmt, ...)          __LOG(this, INFO, fmt, ##__VA_ARGS__)
#define sinfo(fmt, ...)          __LOG(&dockwire::__Log, INFO, fmt, ##__VA_ARGS__)
#define lnotice(sub, fmt, ...)   __LOG(sub, NOTICE, fmt, ##__VA_ARGS__)
#define inotice(fmt, ...)        __LOG(this, NOTICE, fmt, ##__VA_ARGS__)
#define snotice(fmt, ...)        __LOG(&dockwire::__Log, NOTICE, fmt, ##__VA_ARGS__)
#define lerror(sub, fmt, ...)    __LOG(sub, ERROR, fmt, ##__VA_ARGS__)
#define ierror(fmt, ...)         __LOG(this, ERROR, fmt, ##__VA_ARGS__)
#define serror(fmt, ...)         __LOG(&dockwire::__Log, ERROR, fmt, ##__VA_ARGS__)

#ifdef DOCKWIRE_ENABLE_TRACE

#define ltrace(l, fmt, ...)                                           \
    if (dockwire::__Log.getLevel() <= dockwire::log::Level::TRACE)     \
        (l)->log(dockwire::log::Level::TRACE, "%s:%d " fmt, __FILE__, \
                    __LINE__, ##__VA_ARGS__)

#define trace(fmt, ...)  ltrace(this, fmt, ##__VA_ARGS__)
#define strace(fmt, ...) ltrace(&dockwire::__Log, fmt, ##__VA_ARGS__)

#else

#define ltrace(l, fmt, ...)
#define trace(fmt, ...)
#define strace(fmt, ...)

#endif

#endif //DOCKWIRE_LOGGING_H
