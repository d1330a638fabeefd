//
// Created by dc on 01/06/17.
//

#ifndef DOCKWIRE_SOCK_H
#define DOCKWIRE_SOCK_H

#include <dockwire/utils.h>
#include <dockwire/logging.h>

namespace dockwire {

    inline const char* ipstr(ipaddr addr, char *buf = nullptr) {
        char *ret = buf;
        if (buf == nullptr) {
            static char s_buf[IPADDR_MAXSTRLEN] = {0};
            ret = s_buf;
        }
        return ipaddrstr(addr, ret);
    }

    /**
     * The transport primitive used by the HTTP layer. Operations return
     * false (or a short size) on failure and leave the cause in errno,
     * a connect or receive deadline that expires sets errno to ETIMEDOUT.
     * A connection reset by the peer is closed as soon as it is detected
     */
    struct SocketAdaptor {
        virtual bool connect(ipaddr, int64_t timeout = -1) = 0;
        virtual int port() const  = 0;
        virtual const ipaddr addr() const = 0;
        virtual size_t send(const void*, size_t, int64_t timeout = -1) = 0;

        /**
         * sends \param len bytes of the file \param fd starting
         * at \param offset
         * @return the number of bytes sent, less than \param len on failure
         */
        virtual size_t sendfile(int fd, off_t offset, size_t len, int64_t timeout = -1);

        virtual bool flush(int64_t timeout = -1) = 0;

        /**
         * receives exactly \param len bytes
         * @param len the number of bytes wanted, receives the number of
         * bytes actually read. On ECONNRESET these are the bytes that
         * arrived before the peer closed
         */
        virtual bool receive(void* buf, size_t& len, int64_t timeout = -1) = 0;

        /**
         * receives up to and including the first of the given delimiters
         */
        virtual bool receiveuntil(void* buf,
                                  size_t& len,
                                  const char* delims,
                                  size_t ndelims,
                                  int64_t timeout = -1) = 0;
        virtual bool isopen() const  = 0;
        virtual void close() = 0;

        /**
         * @return true if traffic on this socket is encrypted
         */
        virtual bool secure() const { return false; }

        virtual const char *id() {
            if (m_id.empty()) {
                m_id = utils::catstr(ipstr(addr()), ":", port());
            }
            return m_id.c_str();
        }

        virtual ~SocketAdaptor() = default;

    protected:
        /**
         * @return true if the socket is open, otherwise errno is set
         * to ENOTSUP
         */
        bool usable();

        /**
         * inspects errno after a libmill socket call
         * @return true if the call succeeded
         */
        bool completed(const char *op);

        std::string m_id{};
    };

    using SocketPtr = std::unique_ptr<SocketAdaptor>;

    define_log_tag(SSL_SOCK);

    struct SslSock : public virtual SocketAdaptor, LOGGER(SSL_SOCK) {
        SslSock() = default;

        SslSock(const SslSock&) = delete;
        SslSock& operator=(const SslSock&) = delete;

        int port() const override;

        const ipaddr addr() const override;

        bool connect(ipaddr addr, int64_t timeout = -1) override;

        size_t send(const void *buf, size_t len, int64_t timeout = -1) override;

        bool flush(int64_t timeout = -1) override;

        bool receive(void *buf, size_t &len, int64_t timeout = -1) override;

        bool receiveuntil(void *buf, size_t &len, const char *delims,
                          size_t ndelims, int64_t timeout = -1) override;

        bool isopen() const override {
            return raw != nullptr;
        }

        void close() override;

        bool secure() const override { return true; }

        ~SslSock() override {
            close();
        }

    protected:
        sslsock raw{nullptr};
    };

    define_log_tag(TCP_SOCKET);

    struct TcpSock : public virtual SocketAdaptor, LOGGER(TCP_SOCKET) {
        TcpSock() = default;

        TcpSock(const TcpSock&) = delete;
        TcpSock& operator=(const TcpSock&) = delete;

        int port() const override;

        const ipaddr addr() const override;

        bool connect(ipaddr addr, int64_t timeout = -1) override;

        size_t send(const void *buf, size_t len, int64_t timeout = -1) override;

        bool flush(int64_t timeout = -1) override;

        bool receive(void *buf, size_t &len, int64_t timeout = -1) override;

        bool receiveuntil(void *buf, size_t &len, const char *delims,
                          size_t ndelims, int64_t timeout = -1) override;

        bool isopen() const override {
            return raw != nullptr;
        }

        void close() override;

        ~TcpSock() override {
            close();
        }

    protected:
        tcpsock raw{nullptr};
    };

    define_log_tag(UNIX_SOCK);

    /**
     * A socket connected to a filesystem path. The address given to
     * \see connect is ignored, the path bound at construction is
     * always dialed and no host name is ever resolved
     */
    struct UnixSock : public virtual SocketAdaptor, LOGGER(UNIX_SOCK) {
        UnixSock(std::string path)
            : path(std::move(path))
        {}

        UnixSock(const UnixSock&) = delete;
        UnixSock& operator=(const UnixSock&) = delete;

        /**
         * @return always -1, unix sockets have no port
         */
        int port() const override {
            return -1;
        }

        const ipaddr addr() const override {
            return ipaddr{};
        }

        /**
         * dials the socket path. A full listen backlog is retried until
         * the timeout expires
         */
        bool connect(ipaddr addr, int64_t timeout = -1) override;

        size_t send(const void *buf, size_t len, int64_t timeout = -1) override;

        bool flush(int64_t timeout = -1) override;

        bool receive(void *buf, size_t &len, int64_t timeout = -1) override;

        bool receiveuntil(void *buf, size_t &len, const char *delims,
                          size_t ndelims, int64_t timeout = -1) override;

        bool isopen() const override {
            return raw != nullptr;
        }

        void close() override;

        const char *id() override {
            return path.c_str();
        }

        const std::string& socketPath() const {
            return path;
        }

        ~UnixSock() override {
            close();
        }

    protected:
        std::string path;
        unixsock    raw{nullptr};
    };
}
#endif //DOCKWIRE_SOCK_H
