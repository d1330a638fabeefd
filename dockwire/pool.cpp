//
// Created by dc on 13/11/18.
//

#include "pool.h"
#include "errors.h"

namespace dockwire {

    const char* poolclass_name(PoolClass c) {
        switch (c) {
            case PoolClass::Bounded:
                return "bounded";
            case PoolClass::Unbounded:
                return "unbounded";
            default:
                return "unknown";
        }
    }

    Lease::Lease(std::shared_ptr<Pool> pool, SocketPtr sock, bool reused)
        : m_pool(std::move(pool)),
          m_sock(std::move(sock)),
          m_reused(reused)
    {}

    Lease::Lease(Lease &&other) noexcept
        : m_pool(std::move(other.m_pool)),
          m_sock(std::move(other.m_sock)),
          m_keep(other.m_keep),
          m_reused(other.m_reused)
    {}

    Lease& Lease::operator=(Lease &&other) noexcept {
        if (this != &other) {
            release();
            m_pool = std::move(other.m_pool);
            m_sock = std::move(other.m_sock);
            m_keep = other.m_keep;
            m_reused = other.m_reused;
        }
        return Ego;
    }

    void Lease::release() {
        if (m_sock != nullptr) {
            auto pool = std::move(m_pool);
            pool->release(std::move(m_sock), m_keep);
        }
        m_pool = nullptr;
        m_keep = true;
    }

    int64_t Lease::readTimeout() const {
        return m_pool? m_pool->config().readTimeout : -1;
    }

    Pool::Pool(const Endpoint &ep, PoolClass cls, const PoolConfig &config)
        : m_endpoint(ep),
          m_class(cls),
          m_config(config)
    {
        if (m_config.size == 0) {
            throw Exception::invalidArguments("connection pool size must be greater than 0");
        }

        if (m_config.connectTimeout <= 0 || m_class == PoolClass::Unbounded)
            m_config.connectTimeout = -1;
        if (m_config.readTimeout <= 0)
            m_config.readTimeout = -1;

        m_tokens = chmake(char, m_config.size);
        if (m_tokens == nullptr) {
            throw Exception::create("creating connection pool channel failed: ", errno_s);
        }
        for (size_t i = 0; i < m_config.size; i++) {
            chs(m_tokens, char, 1);
        }

        registerScheme("http", [] {
            return SocketPtr(new TcpSock());
        });

        registerScheme("https", [] {
            return SocketPtr(new SslSock());
        });

        if (m_endpoint.isUnix()) {
            std::string path{m_endpoint.socketPath()};
            registerScheme("unix", [path] {
                return SocketPtr(new UnixSock(path));
            });
        }

        idebug("%s pool {size: %lu, connect: %ld, read: %ld} for %s", poolclass_name(m_class),
               m_config.size, m_config.connectTimeout, m_config.readTimeout, m_endpoint.uri().c_str());
    }

    void Pool::registerScheme(const std::string &scheme, Transport transport) {
        m_transports[scheme] = std::move(transport);
    }

    bool Pool::take(int64_t dd) {
        char tok{0};
        if (dd < 0) {
            tok = chr(m_tokens, char);
        }
        else {
            bool timedout{false};
            choose {
                chin(m_tokens, char, tmp):
                    tok = tmp;
                deadline(dd):
                    timedout = true;
                chend
            }

            if (timedout) {
                throw ConnectTimeout(utils::catstr("timeout waiting for a connection from the ",
                                                   poolclass_name(m_class), " pool"));
            }
        }

        // a done channel delivers 0 once the pool is shut down
        return tok != 0 && !m_stopped;
    }

    void Pool::giveback() {
        if (!m_stopped) {
            // the token channel no longer takes tokens once done
            chs(m_tokens, char, 1);
        }
    }

    SocketPtr Pool::open() {
        auto it = m_transports.find(m_endpoint.scheme());
        if (it == m_transports.end()) {
            throw Exception::unsupportedOperation("no transport registered for scheme '",
                                                  m_endpoint.scheme(), "'");
        }

        SocketPtr sock = it->second();
        if (!m_endpoint.isUnix() && !m_resolved) {
            m_addr = ipremote(m_endpoint.host().c_str(), m_endpoint.port(), 0,
                              utils::after(m_config.connectTimeout));
            if (errno != 0) {
                if (errno == ETIMEDOUT) {
                    throw ConnectTimeout(utils::catstr("resolving '", m_endpoint.host(), "' timed out"));
                }
                throw Exception::create("resolving '", m_endpoint.host(), "' failed: ", errno_s);
            }
            m_resolved = true;
        }

        if (!sock->connect(m_addr, m_config.connectTimeout)) {
            int err = errno;
            switch (err) {
                case ETIMEDOUT:
                    throw ConnectTimeout(utils::catstr("connecting to '", m_endpoint.uri(), "' timed out"));
                case EINTR:
                case ECANCELED:
                    throw InterruptedIO(utils::catstr("connecting to '", m_endpoint.uri(), "' interrupted"));
                default:
                    throw Exception::create("connecting to '", m_endpoint.uri(), "' failed: ", strerror(err));
            }
        }

        trace("new %s connection %s", poolclass_name(m_class), sock->id());
        return sock;
    }

    Lease Pool::acquire() {
        if (m_stopped) {
            throw Exception::create("the ", poolclass_name(m_class), " connection pool is shut down");
        }

        if (!take(utils::after(m_config.connectTimeout))) {
            throw Exception::create("the ", poolclass_name(m_class), " connection pool is shut down");
        }

        while (!m_idle.empty()) {
            SocketPtr sock = std::move(m_idle.back());
            m_idle.pop_back();
            if (sock->isopen()) {
                m_leased++;
                m_acquired++;
                return Lease(shared_from_this(), std::move(sock), true);
            }
        }

        SocketPtr sock{nullptr};
        try {
            sock = open();
        }
        catch (...) {
            // the token goes back, the acquisition never completed
            giveback();
            throw;
        }

        m_leased++;
        m_acquired++;
        return Lease(shared_from_this(), std::move(sock), false);
    }

    void Pool::release(SocketPtr sock, bool keep) {
        m_leased--;
        m_released++;
        if (m_stopped || !keep || !sock->isopen()) {
            trace("closing %s connection %s", poolclass_name(m_class), sock->id());
            sock->close();
        }
        else {
            m_idle.push_back(std::move(sock));
        }

        giveback();
    }

    void Pool::shutdown() {
        if (m_stopped) {
            return;
        }

        m_stopped = true;
        idebug("shutting down %s pool {idle: %lu, leased: %lu}", poolclass_name(m_class),
               m_idle.size(), m_leased);
        while (!m_idle.empty()) {
            m_idle.back()->close();
            m_idle.pop_back();
        }

        // wake up everyone waiting for a token
        chdone(m_tokens, char, 0);
    }

    Pool::~Pool() {
        shutdown();
        if (m_tokens) {
            chclose(m_tokens);
            m_tokens = nullptr;
        }
    }

    Pools::Pools(const Endpoint &ep, const PoolConfig &config)
        : m_bounded(Pool::mkshared(ep, PoolClass::Bounded, config)),
          m_unbounded(Pool::mkshared(ep, PoolClass::Unbounded, config))
    {}

    void Pools::shutdown() {
        m_bounded->shutdown();
        m_unbounded->shutdown();
    }
}
