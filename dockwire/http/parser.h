//
// Created by dc on 28/06/17.
//

#ifndef DOCKWIRE_HTTP_PARSER_H
#define DOCKWIRE_HTTP_PARSER_H

#include <http_parser.h>

#include <dockwire/buffer.h>
#include <dockwire/utils.h>

namespace dockwire::http {

    /**
     * Incremental HTTP message parser, a thin layer over nodejs
     * http_parser which collects headers and hands body bytes (already
     * de-chunked) to \see handleBodyPart
     */
    struct Parser : public http_parser {
        CaseMap<std::string> headers;

        Parser(Parser&&) = default;
        Parser& operator=(Parser&&) = default;

        virtual ~Parser() = default;

    protected:
        Parser(http_parser_type type = HTTP_RESPONSE);

        /**
         * feeds raw bytes into the parser
         * @param buf the bytes to parse
         * @param len the number of bytes in \param buf
         * @return false if the bytes could not be parsed
         */
        bool feed(const char *buf, size_t len);

        /**
         * signals the end of the connection to the parser, required
         * to complete messages whose body is delimited by the
         * connection closing
         */
        inline bool done() {
            return feed(nullptr, 0);
        }

        inline bool chunked() const {
            return (flags & F_CHUNKED) != 0;
        }

        inline bool keepalive() const {
            return http_should_keep_alive(this) != 0;
        }

        const char* error() const {
            return http_errno_name((enum http_errno) http_errno);
        }

        virtual int handleBodyPart(const char *at, size_t length) {
            return 0;
        }

        void clear();

        bool headersComplete{false};
        bool bodyComplete{false};

    private:
        enum {
            STATE_FIELD = 0,
            STATE_VALUE
        };

        static int onMessageBegin(http_parser *);

        static int onHeaderField(http_parser *, const char *, size_t);

        static int onHeaderValue(http_parser *, const char *, size_t);

        static int onHeadersComplete(http_parser *);

        static int onBody(http_parser *, const char *, size_t);

        static int onMsgComplete(http_parser *);

        void pushHeader();

        int         state{STATE_FIELD};
        std::string hf{};
        std::string hv{};
    };
}

#endif //DOCKWIRE_HTTP_PARSER_H
