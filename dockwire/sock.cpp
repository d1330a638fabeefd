//
// Created by dc on 30/10/18.
//

#include <unistd.h>

#include <algorithm>

#include "sock.h"

namespace dockwire {

    bool SocketAdaptor::usable() {
        if (isopen())
            return true;
        strace("%s: socket is closed", id());
        errno = ENOTSUP;
        return false;
    }

    bool SocketAdaptor::completed(const char *op) {
        if (errno == 0)
            return true;

        int err = errno;
        strace("%s: %s failed: %s", id(), op, strerror(err));
        if (err == ECONNRESET)
            close();
        errno = err;
        return false;
    }

    size_t SocketAdaptor::sendfile(int fd, off_t offset, size_t len, int64_t timeout) {
        if (!usable())
            return 0;

        char buf[8192];
        size_t total{0};
        while (total < len) {
            ssize_t nrd = ::pread(fd, buf, std::min(sizeof(buf), len - total), offset + total);
            if (nrd <= 0) {
                if (nrd == 0)
                    errno = EIO;
                return total;
            }

            size_t nwr = send(buf, (size_t) nrd, timeout);
            total += nwr;
            if (nwr != (size_t) nrd)
                return total;
        }
        errno = 0;
        return total;
    }

    int SslSock::port() const {
        return isopen()? sslport(raw) : -1;
    }

    const ipaddr SslSock::addr() const {
        return isopen()? ssladdr(raw) : ipaddr{};
    }

    bool SslSock::connect(ipaddr addr, int64_t timeout) {
        if (isopen()) {
            errno = EISCONN;
            return false;
        }

        raw = sslconnect(addr, utils::after(timeout));
        if (raw == nullptr) {
            int err = errno;
            trace("tls connect to %s failed: %s", ipstr(addr), strerror(err));
            errno = err;
            return false;
        }
        return true;
    }

    size_t SslSock::send(const void *buf, size_t len, int64_t timeout) {
        if (!usable())
            return 0;
        size_t ns = sslsend(raw, buf, (int) len, utils::after(timeout));
        return completed("send")? ns : 0;
    }

    bool SslSock::flush(int64_t timeout) {
        if (!usable())
            return false;
        sslflush(raw, utils::after(timeout));
        return completed("flush");
    }

    bool SslSock::receive(void *buf, size_t &len, int64_t timeout) {
        if (!usable()) {
            len = 0;
            return false;
        }
        len = sslrecv(raw, buf, (int) len, utils::after(timeout));
        return completed("receive");
    }

    bool SslSock::receiveuntil(void *buf, size_t &len, const char *delims,
                               size_t ndelims, int64_t timeout) {
        if (!usable()) {
            len = 0;
            return false;
        }
        len = sslrecvuntil(raw, buf, len, delims, ndelims, utils::after(timeout));
        return completed("receive");
    }

    void SslSock::close() {
        if (raw != nullptr) {
            sslclose(raw);
            raw = nullptr;
        }
    }

    int TcpSock::port() const {
        return isopen()? tcpport(raw) : -1;
    }

    const ipaddr TcpSock::addr() const {
        return isopen()? tcpaddr(raw) : ipaddr{};
    }

    bool TcpSock::connect(ipaddr addr, int64_t timeout) {
        if (isopen()) {
            errno = EISCONN;
            return false;
        }

        raw = tcpconnect(addr, utils::after(timeout));
        if (raw == nullptr) {
            int err = errno;
            trace("connect to %s failed: %s", ipstr(addr), strerror(err));
            errno = err;
            return false;
        }
        return true;
    }

    size_t TcpSock::send(const void *buf, size_t len, int64_t timeout) {
        if (!usable())
            return 0;
        size_t ns = tcpsend(raw, buf, len, utils::after(timeout));
        return completed("send")? ns : 0;
    }

    bool TcpSock::flush(int64_t timeout) {
        if (!usable())
            return false;
        tcpflush(raw, utils::after(timeout));
        return completed("flush");
    }

    bool TcpSock::receive(void *buf, size_t &len, int64_t timeout) {
        if (!usable()) {
            len = 0;
            return false;
        }
        len = tcprecv(raw, buf, len, utils::after(timeout));
        return completed("receive");
    }

    bool TcpSock::receiveuntil(void *buf, size_t &len, const char *delims,
                               size_t ndelims, int64_t timeout) {
        if (!usable()) {
            len = 0;
            return false;
        }
        len = tcprecvuntil(raw, buf, len, delims, ndelims, utils::after(timeout));
        return completed("receive");
    }

    void TcpSock::close() {
        if (raw != nullptr) {
            tcpclose(raw);
            raw = nullptr;
        }
    }

    bool UnixSock::connect(ipaddr, int64_t timeout) {
        if (isopen()) {
            errno = EISCONN;
            return false;
        }

        int64_t dd = utils::after(timeout);
        while ((raw = unixconnect(path.c_str())) == nullptr) {
            if (errno != EAGAIN) {
                int err = errno;
                trace("connect to unix://%s failed: %s", path.c_str(), strerror(err));
                errno = err;
                return false;
            }

            // backlog full
            int64_t at = now() + 10;
            if (dd >= 0) {
                if (now() >= dd) {
                    idebug("connect to unix://%s timed out", path.c_str());
                    errno = ETIMEDOUT;
                    return false;
                }
                at = std::min(at, dd);
            }
            msleep(at);
        }
        return true;
    }

    size_t UnixSock::send(const void *buf, size_t len, int64_t timeout) {
        if (!usable())
            return 0;
        size_t ns = unixsend(raw, buf, len, utils::after(timeout));
        return completed("send")? ns : 0;
    }

    bool UnixSock::flush(int64_t timeout) {
        if (!usable())
            return false;
        unixflush(raw, utils::after(timeout));
        return completed("flush");
    }

    bool UnixSock::receive(void *buf, size_t &len, int64_t timeout) {
        if (!usable()) {
            len = 0;
            return false;
        }
        len = unixrecv(raw, buf, len, utils::after(timeout));
        return completed("receive");
    }

    bool UnixSock::receiveuntil(void *buf, size_t &len, const char *delims,
                                size_t ndelims, int64_t timeout) {
        if (!usable()) {
            len = 0;
            return false;
        }
        len = unixrecvuntil(raw, buf, len, delims, ndelims, utils::after(timeout));
        return completed("receive");
    }

    void UnixSock::close() {
        if (raw != nullptr) {
            unixclose(raw);
            raw = nullptr;
        }
    }
}
