//
// Created by dc on 09/11/18.
//

#ifndef DOCKWIRE_BASE_H
#define DOCKWIRE_BASE_H

#include <sys/param.h>
#include <cerrno>
#include <cstdarg>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <sstream>
#include <string_view>

#include <libmill/libmill.h>

#include <dockwire/symbols.h>

/**
 * timeouts and deadlines are all expressed in milliseconds
 */
inline signed long long operator ""_ms(unsigned long long m) { return m; }

inline signed long long operator ""_sec(unsigned long long s) { return s * 1000_ms; }

#define Ego (*this)

#define errno_s strerror(errno)

/**
 * iod symbols, all of them are declared in dockwire/symbols.h
 *
 * @code
 * docker::Client client(opt(endpoint, "unix:///var/run/docker.sock"), opt(poolSize, 4));
 * @endcode
 */
#define var(v) s::_##v
#define opt(o, v) var(o) = v
// a field of an iod record, prop(Id, std::string)
#define prop(name, tp) var(name)  = tp()

// length of a string literal, sizeofcstr("unix://") == 7
#define sizeofcstr(ch)   (sizeof(ch)-1)

namespace dockwire {
    using strview = std::string_view;

    /**
     * gives \param type a Ptr alias and a mkshared factory
     */
#define sptr(type)                          \
public:                                     \
    using Ptr = std::shared_ptr< type >;    \
    template <typename... Args>             \
    inline static Ptr mkshared(Args... args) {          \
        return std::make_shared< type >(    \
            std::forward<Args>(args)...);   \
    }

    // libmill clock, milliseconds
    inline int64_t now() { return mnow(); }

    /**
     * Base of every error raised by dockwire. The numeric code
     * identifies the error class, see errors.h for the client codes
     */
    struct Exception : std::exception {

        static constexpr int OutOfRange                 = 11;
        static constexpr int UnsupportedOperation       = 12;
        static constexpr int InvalidArguments           = 15;
        static constexpr int ProtocolError              = 17;

        Exception(std::string&& msg = "", int code = 0)
                : std::exception(),
                  Code{code},
                  Msg{std::move(msg)}
        {}

        Exception(const Exception&) = default;
        Exception&operator=(const Exception&) = default;

        Exception(Exception&& e) noexcept
                : Code(e.Code),
                  Msg(std::move(e.Msg))
        { e.Code = 0; }

        Exception&operator=(Exception&& e) noexcept {
            Code = e.Code;
            Msg  = std::move(e.Msg);
            e.Code = 0;
            return *this;
        }

        /**
         * builds the message by streaming \param args one after the other
         *
         * @code
         * throw Exception::create(Exception::ProtocolError, "unexpected frame type ", type);
         * @endcode
         */
        template <typename... Args>
        static Exception create(int code, Args... args) {
            std::stringstream ss;
            create(ss, std::forward<Args>(args)...);
            return Exception(ss.str(), code);
        }

        template <typename... Args>
        static inline Exception create(Args... args) {
            return create(0, std::forward<Args>(args)...);
        }

        template <typename... Args>
        static inline Exception unsupportedOperation(Args... args) {
            return create(UnsupportedOperation, "UnsupportedOperation: ",std::forward<Args>(args)...);
        }

        template <typename... Args>
        static inline Exception outOfRange(Args... args) {
            return create(OutOfRange, "OutOfRangeError: ",std::forward<Args>(args)...);
        }

        template <typename... Args>
        static inline Exception invalidArguments(Args... args) {
            return create(InvalidArguments, "InvalidArgumentsError: ",std::forward<Args>(args)...);
        }

        template <typename... Args>
        static inline Exception protocolError(Args... args) {
            return create(ProtocolError, "ProtocolError: ", std::forward<Args>(args)...);
        }

        int Code{0};
        std::string Msg{""};

        const char* what() const noexcept override {
            return Msg.c_str();
        }

    private:
        template <typename Arg, typename... Args>
        static void create(std::stringstream& ss, Arg arg, Args... args) {
            ss << arg;
            if constexpr (sizeof...(args))
                create(ss, std::forward<Args>(args)...);
        }
    };

    /**
     * Date/Time formatting used by the logger and the HTTP Date header
     */
    struct Datetime {
        // captures the current UTC time
        Datetime();

        /**
         * strftime(3) into \param out
         * @return \param out, or nullptr if any argument is empty
         */
        const char* str(char *out, size_t sz, const char *fmt);

        /**
         * @return the time in \see LOG_FMT, held in a static buffer that
         * the next call overwrites
         */
        const char* operator()() {
            static char buf[64] = {0};
            return str(buf, sizeof(buf), LOG_FMT);
        }

    private:
        struct tm       m_tm{};
        time_t          m_t{0};

    public:
        /**
         * @static
         * HTTP date string format
         */
        static constexpr const char *HTTP_FMT = "%a, %d %b %Y %T GMT";
        /**
         * @static
         * dockwire date/time logging string format
         */
        static constexpr const char *LOG_FMT  = "%Y-%m-%d %H:%M:%S";
    };

    namespace version {
        extern const uint8_t   MAJOR;
        extern const uint8_t   MINOR;
        extern const uint16_t  PATCH;
        extern const char*     STRING;
        extern const char*     SWNAME;
    }
}
#endif //DOCKWIRE_BASE_H
