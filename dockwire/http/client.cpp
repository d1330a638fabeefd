//
// Created by dc on 9/7/17.
//
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <climits>

#include "client.h"
#include "../errors.h"

namespace dockwire::http {

#undef  CRLF
#define CRLF "\r\n"

    Request::Request(Method method, std::string resource)
        : m_method(method),
          m_resource(std::move(resource))
    {}

    Request& Request::body(const strview &data, const char *ctype) {
        m_body.reset(data.size(), true);
        m_body.append(data);
        m_file.clear();
        hdr("Content-Type", std::string(ctype));
        return Ego;
    }

    Request& Request::file(const std::string &path, const char *ctype) {
        m_body.reset(0, true);
        m_file = path;
        hdr("Content-Type", std::string(ctype));
        return Ego;
    }

    void Request::encodeargs(OBuffer &dst) const {
        if (!m_args.empty()) {
            dst << "?";
            bool first{true};
            for(auto& arg: m_args) {
                if (!first) {
                    dst << "&";
                }
                first = false;
                dst << arg.first << "=" << arg.second;
            }
        }
    }

    void Request::encodehdrs(OBuffer &dst) const {
        for (auto& hdr: m_headers) {
            dst << hdr.first << ": " << hdr.second << CRLF;
        }
    }

    std::string Request::target() const {
        OBuffer ob(m_resource.size() + 64);
        ob << m_resource;
        encodeargs(ob);
        return std::string(ob);
    }

    static void sendfailed(const char *what) {
        int err = errno;
        switch (err) {
            case ETIMEDOUT:
                throw ReadTimeout(utils::catstr(what, " timed out"));
            case EINTR:
            case ECANCELED:
                throw InterruptedIO(utils::catstr(what, " interrupted"));
            default:
                throw Exception::create(what, " failed: ", strerror(err));
        }
    }

    void Request::submit(SocketAdaptor &sock, const std::string &host, int64_t timeout) {
        int    fd{-1};
        size_t content_length{m_body.size()};
        if (!m_file.empty()) {
            fd = ::open(m_file.c_str(), O_RDONLY);
            if (fd < 0) {
                throw Exception::create("opening request body '", m_file, "' failed: ", errno_s);
            }
            struct stat st{};
            if (fstat(fd, &st) != 0) {
                ::close(fd);
                throw Exception::create("reading size of '", m_file, "' failed: ", errno_s);
            }
            content_length = (size_t) st.st_size;
        }

        hdr("Host", host);
        char date[64];
        hdr("User-Agent", utils::catstr(version::SWNAME, "/", version::STRING));
        hdr("Date", std::string(Datetime().str(date, sizeof(date), Datetime::HTTP_FMT)));
        if (content_length > 0 || m_method == Method::Post || m_method == Method::Put) {
            hdr("Content-Length", content_length);
        }

        OBuffer head(1023);
        head << method_name(m_method) << " " << m_resource;
        encodeargs(head);
        head << " HTTP/1.1" << CRLF;
        encodehdrs(head);
        head << CRLF;

        trace("%s - submitting %s %s", sock.id(), method_name(m_method), m_resource.c_str());
        size_t nwr = sock.send(head.data(), head.size(), timeout);
        if (nwr != head.size()) {
            /* sending headers failed, no need to send body */
            if (fd >= 0) ::close(fd);
            sendfailed("sending request headers");
        }

        if (fd >= 0) {
            nwr = sock.sendfile(fd, 0, content_length, timeout);
            ::close(fd);
            if (nwr != content_length) {
                sendfailed("uploading request body");
            }
        }
        else if (!m_body.empty()) {
            nwr = sock.send(m_body.data(), m_body.size(), timeout);
            if (nwr != m_body.size()) {
                sendfailed("sending request body");
            }
        }

        if (!sock.flush(timeout)) {
            sendfailed("flushing request");
        }
    }

    Response::Response()
        : Parser(HTTP_RESPONSE)
    {}

    void Response::fail(const char *what) {
        int err = errno;
        // the connection is in an unknown state
        m_lease.discard();
        m_lease.release();
        switch (err) {
            case ETIMEDOUT:
                throw ReadTimeout(utils::catstr(what, " timed out"));
            case EINTR:
            case ECANCELED:
                throw InterruptedIO(utils::catstr(what, " interrupted"));
            case ECONNRESET:
                throw Exception::create(what, " failed: connection closed by server");
            default:
                throw Exception::create(what, " failed: ", strerror(err));
        }
    }

    void Response::receive(Lease &&lease) {
        m_lease = std::move(lease);
        m_timeout = m_lease.readTimeout();

        char line[4096];
        while (!headersComplete) {
            size_t len = sizeof(line);
            bool ok = m_lease->receiveuntil(line, len, "\n", 1, m_timeout);
            m_received += len;
            if (!ok) {
                fail("receiving response headers");
            }

            if (!feed(line, len)) {
                m_lease.discard();
                m_lease.release();
                throw Exception::protocolError("parsing response headers failed: ", error());
            }
        }

        trace("response %d, content length %llu", status(), content_length);
        if (status() >= 400) {
            std::string text{};
            try {
                readAll(text);
            }
            catch (const std::exception& ex) {
                // the error keeps whatever part of the message arrived
                idebug("reading error response body failed: %s", ex.what());
            }
            throw ResponseError(status(), std::move(text));
        }

        if (bodyComplete) {
            finish();
        }
    }

    strview Response::hdr(const std::string &name) const {
        auto it = headers.find(name);
        if (it != headers.end()) {
            return it->second;
        }
        return strview{};
    }

    int Response::handleBodyPart(const char *at, size_t length) {
        m_pending.append(at, length);
        return 0;
    }

    void Response::pull(size_t want) {
        if (!m_lease) {
            throw Exception::create("reading response body failed: connection already released");
        }

        char   buf[8192];
        size_t len = MIN(MAX(want, (size_t) 1), sizeof(buf));
        bool   ok;
        if (content_length > 0 && content_length != ULLONG_MAX) {
            // known number of bytes, either the body or the current chunk
            len = (size_t) MIN(content_length, len);
            ok  = m_lease->receive(buf, len, m_timeout);
        }
        else if (chunked()) {
            // chunk size line, chunk terminator or trailer
            len = sizeof(buf);
            ok  = m_lease->receiveuntil(buf, len, "\n", 1, m_timeout);
        }
        else {
            // body ends when the server closes the connection. Streamed
            // records are newline terminated, each is handed over as soon
            // as it is complete
            ok = m_lease->receiveuntil(buf, len, "\n", 1, m_timeout);
            if (!ok && errno == ENOBUFS) {
                // filled the buffer before a newline
                ok = true;
            }
            if (!ok && errno == ECONNRESET) {
                m_received += len;
                if ((len > 0 && !feed(buf, len)) || !done()) {
                    throw Exception::protocolError("parsing response body failed: ", error());
                }
                m_lease.discard();
                return;
            }
        }

        m_received += len;
        if (!ok) {
            if (errno != ETIMEDOUT || len == 0) {
                fail("receiving response body");
            }
            // a slow body, what arrived is kept and the next read waits again
            trace("%lu body bytes received before the read timed out", len);
        }

        if (!feed(buf, len)) {
            m_lease.discard();
            m_lease.release();
            throw Exception::protocolError("parsing response body failed: ", error());
        }
    }

    size_t Response::read(void *buf, size_t len) {
        while (m_pending.empty() && !bodyComplete) {
            pull(len);
        }

        if (m_pending.empty()) {
            finish();
            return 0;
        }

        size_t n = MIN(len, m_pending.size());
        memcpy(buf, m_pending.data(), n);
        m_pending.consume(n);
        if (m_pending.empty() && bodyComplete) {
            finish();
        }
        return n;
    }

    std::string Response::readAll() {
        std::string out{};
        readAll(out);
        return out;
    }

    void Response::readAll(std::string &out) {
        char buf[4096];
        size_t nrd;
        while ((nrd = read(buf, sizeof(buf))) > 0) {
            out.append(buf, nrd);
        }
    }

    void Response::finish() {
        if (m_lease) {
            if (!keepalive()) {
                m_lease.discard();
            }
            m_lease.release();
        }
    }

    void Response::close() {
        if (m_lease) {
            if (!exhausted()) {
                m_lease.discard();
            }
            m_lease.release();
        }
        m_pending.reset(0, true);
    }

    Response::~Response() {
        close();
    }

#undef CRLF
}
