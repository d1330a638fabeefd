//
// Created by dc on 9/7/17.
//

#ifndef DOCKWIRE_HTTP_CLIENT_H
#define DOCKWIRE_HTTP_CLIENT_H

#include <vector>

#include <dockwire/http.h>
#include <dockwire/pool.h>
#include <dockwire/http/parser.h>

namespace dockwire::http {

    /**
     * A byte source over a response body which has already been
     * de-chunked
     */
    struct BodySource {
        /**
         * reads at most \param len bytes of the body, blocking until at
         * least one byte is available
         * @return the number of bytes copied into \param buf, 0 once the
         * body is exhausted
         * @throws ReadTimeout, InterruptedIO or Exception if reading fails
         */
        virtual size_t read(void *buf, size_t len) = 0;

        virtual ~BodySource() = default;
    };

    define_log_tag(HTTP_CLIENT);

    struct Request : LOGGER(HTTP_CLIENT) {
        Request(Method method, std::string resource);

        Request(Request&&) = default;
        Request& operator=(Request&&) = default;

        Request(const Request&) = delete;
        Request& operator=(const Request&) = delete;

        Request& hdr(const std::string& name, std::string value) {
            m_headers[name] = std::move(value);
            return Ego;
        }

        template <typename V>
        Request& hdr(const std::string& name, const V& value) {
            return hdr(name, utils::tostr(value));
        }

        /**
         * adds a query string argument, the value is url encoded
         */
        template <typename V>
        Request& arg(const std::string& name, const V& value) {
            m_args.emplace_back(name, utils::urlencode(utils::tostr(value)));
            return Ego;
        }

        /**
         * sets the request body
         * @param data the body data
         * @param ctype the content type of the body
         */
        Request& body(const strview& data, const char *ctype = "application/json");

        /**
         * sends the given file as the request body
         * @param path path to the file to send
         * @param ctype the content type of the file
         */
        Request& file(const std::string& path, const char *ctype);

        Method method() const { return m_method; }

        /**
         * @return the resource together with the encoded query string
         */
        std::string target() const;

        /**
         * writes the request to the given socket
         * @param sock the socket to write to
         * @param host the value of the Host header
         * @param timeout the timeout of each write
         * @throws ReadTimeout, InterruptedIO or Exception when sending fails
         */
        void submit(SocketAdaptor& sock, const std::string& host, int64_t timeout);

    private:
        void encodeargs(OBuffer& dst) const;

        void encodehdrs(OBuffer& dst) const;

        Method               m_method;
        std::string          m_resource;
        CaseMap<std::string> m_headers{};
        std::vector<std::pair<std::string, std::string>> m_args{};
        OBuffer              m_body{};
        std::string          m_file{};
    };

    /**
     * A response read from a leased connection. Headers are read by
     * \see receive, the body is read on demand through \see read. The
     * lease goes back to its pool once the body is exhausted, or is
     * discarded if the response is dropped before that
     */
    struct Response : public Parser, public BodySource, LOGGER(HTTP_CLIENT) {
        Response();

        Response(Response&&) = default;
        Response& operator=(Response&&) = default;

        /**
         * reads the response headers from the leased connection and
         * takes ownership of the lease
         *
         * @throws ResponseError if the server answered with an error status
         * @throws ReadTimeout, InterruptedIO or Exception if reading fails
         */
        void receive(Lease&& lease);

        int status() const {
            return (int) status_code;
        }

        /**
         * @return the value of the header \param name, empty if the
         * response doesn't have it
         */
        strview hdr(const std::string& name) const;

        size_t read(void *buf, size_t len) override;

        /**
         * reads the rest of the body
         * @return the body as text
         */
        std::string readAll();

        /**
         * appends the rest of the body to \param out, bytes read before
         * a failure stay in \param out
         */
        void readAll(std::string& out);

        /**
         * @return true once the whole body was consumed
         */
        bool exhausted() const {
            return bodyComplete && m_pending.empty();
        }

        /**
         * @return true if any byte of the response was received
         */
        bool started() const {
            return m_received > 0;
        }

        /**
         * drops the response, a connection whose body has not been
         * fully read cannot be reused
         */
        void close();

        ~Response() override;

    protected:
        int handleBodyPart(const char *at, size_t length) override;

    private:
        void pull(size_t want);

        void finish();

        [[noreturn]] void fail(const char *what);

        Lease   m_lease{};
        OBuffer m_pending{};
        int64_t m_timeout{-1};
        size_t  m_received{0};
    };
}

#endif //DOCKWIRE_HTTP_CLIENT_H
