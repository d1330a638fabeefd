//
// Created by dc on 31/05/17.
//

#ifndef DOCKWIRE_UTILS_H
#define DOCKWIRE_UTILS_H

#include <map>
#include <sstream>
#include <strings.h>

#include <dockwire/buffer.h>

namespace dockwire {

    /**
     * case insensitive comparator, header names are compared
     * with this
     */
    struct CaseLess {
        bool operator()(const std::string& a, const std::string& b) const {
            return strcasecmp(a.c_str(), b.c_str()) < 0;
        }
    };

    template <typename V>
    using CaseMap = std::map<std::string, V, CaseLess>;

    namespace utils {
        /**
         * compute the deadline time in milliseconds given a timeout
         * @param tout the timeout whose deadline will be computed
         * @return the computed deadline, if the given timeout is less
         * than 0, the deadline will be -1
         */
        static inline int64_t after(int64_t tout) {
            return tout < 0 ? -1 : mnow() + tout;
        }

        /**
         * converts any streamable value to a string
         */
        template <typename T>
        inline std::string tostr(const T& t) {
            std::stringstream ss;
            ss << t;
            return ss.str();
        }

        inline std::string tostr(bool b) {
            return b? "true" : "false";
        }

        /**
         * concatenate the given arguments into a single string
         * @param args the arguments to concatenate
         * @return the concatenated string
         *
         * @code
         * auto path = utils::catstr("/", version, "/containers/", id);
         * @endcode
         */
        template <typename... Args>
        inline std::string catstr(const Args&... args) {
            std::stringstream ss;
            (void) std::initializer_list<int>{ (ss << args, 0)... };
            return ss.str();
        }

        inline bool startswith(const strview& str, const strview& prefix) {
            return str.size() >= prefix.size() &&
                   str.compare(0, prefix.size(), prefix) == 0;
        }

        /**
         * url encode the given string
         * @param str the string to encode
         * @return url encoded copy of \param str
         */
        std::string urlencode(const strview& str);

        namespace base64 {
            /**
             * base64 encode the given buffer
             * @param ob the output buffer
             * @param data the data to encode
             * @param sz the size of the data
             */
            void encode(OBuffer& ob, const uint8_t *data, size_t sz);

            inline std::string encode(const strview& str) {
                OBuffer ob{};
                encode(ob, (const uint8_t *) str.data(), str.size());
                return std::string(ob);
            }
        }
    }
}

#endif //DOCKWIRE_UTILS_H
