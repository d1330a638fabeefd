//
// Created by dc on 13/11/18.
//

#ifndef DOCKWIRE_POOL_H
#define DOCKWIRE_POOL_H

#include <deque>
#include <functional>
#include <map>

#include <dockwire/endpoint.h>
#include <dockwire/sock.h>

namespace dockwire {

    /**
     * The two timeout classes a request can be issued under
     */
    enum class PoolClass : uint8_t {
        /** connect, queue-wait and read timeouts all apply */
        Bounded,
        /** only the read timeout applies, for calls that block server side */
        Unbounded
    };

    const char* poolclass_name(PoolClass c);

    struct PoolConfig {
        /** connect and queue-wait timeout, -1 waits forever */
        int64_t connectTimeout{5_sec};
        /** read inactivity timeout, -1 waits forever */
        int64_t readTimeout{30_sec};
        /** total number of connections, which is also the per route limit */
        size_t  size{100};
    };

    /**
     * creates an unconnected socket for a scheme
     */
    using Transport = std::function<SocketPtr()>;

    struct Pool;

    /**
     * A connection borrowed from a pool. The connection goes back to the
     * pool when the lease is released or destroyed, a discarded lease
     * closes the connection instead
     */
    struct Lease {
        Lease() = default;

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& other) noexcept;

        Lease& operator=(Lease&& other) noexcept;

        ~Lease() {
            release();
        }

        SocketAdaptor& sock() {
            if (m_sock == nullptr) {
                throw Exception::unsupportedOperation("access to a released lease");
            }
            return *m_sock;
        }

        SocketAdaptor* operator->() {
            return &sock();
        }

        /**
         * returns the connection to its pool, does nothing
         * on a released lease
         */
        void release();

        /**
         * the connection is in an unknown state and must be closed
         * instead of being reused
         */
        void discard() {
            m_keep = false;
        }

        /**
         * @return true if the connection was taken from the idle list
         */
        bool reused() const {
            return m_reused;
        }

        int64_t readTimeout() const;

        explicit operator bool() const {
            return m_sock != nullptr;
        }

    private:
        friend struct Pool;
        Lease(std::shared_ptr<Pool> pool, SocketPtr sock, bool reused);

        std::shared_ptr<Pool> m_pool{nullptr};
        SocketPtr             m_sock{nullptr};
        bool                  m_keep{true};
        bool                  m_reused{false};
    };

    define_log_tag(POOL);

    /**
     * A bounded set of reusable connections to the one endpoint of a client.
     * A channel pre-filled with one token per connection acts as the
     * counting semaphore, acquire takes a token and release gives it back
     */
    struct Pool : LOGGER(POOL), std::enable_shared_from_this<Pool> {
        sptr(Pool)

        Pool(const Endpoint& ep, PoolClass cls, const PoolConfig& config);

        Pool(const Pool&) = delete;
        Pool& operator=(const Pool&) = delete;

        /**
         * borrows a connection, connecting a new one if none is idle.
         * Blocks while every connection is leased
         *
         * @return a connected lease
         * @throws ConnectTimeout if no connection becomes available or
         * connecting does not complete within the connect timeout
         * @throws InterruptedIO if connecting was interrupted
         * @throws Exception if the pool is shut down or connecting failed
         */
        Lease acquire();

        /**
         * closes idle connections and refuses further acquisitions,
         * connections still leased are closed when returned
         */
        void shutdown();

        /**
         * registers the transport used for \param scheme
         */
        void registerScheme(const std::string& scheme, Transport transport);

        bool hasScheme(const std::string& scheme) const {
            return m_transports.find(scheme) != m_transports.end();
        }

        PoolClass poolClass() const { return m_class; }

        const PoolConfig& config() const { return m_config; }

        size_t capacity() const { return m_config.size; }

        size_t idle() const { return m_idle.size(); }

        size_t leased() const { return m_leased; }

        uint64_t acquired() const { return m_acquired; }

        uint64_t released() const { return m_released; }

        bool isShutdown() const { return m_stopped; }

        ~Pool();

    private:
        friend struct Lease;

        void release(SocketPtr sock, bool keep);

        bool take(int64_t dd);

        void giveback();

        SocketPtr open();

        Endpoint         m_endpoint;
        PoolClass        m_class;
        PoolConfig       m_config;
        std::map<std::string, Transport> m_transports{};
        std::deque<SocketPtr> m_idle{};
        chan             m_tokens{nullptr};
        ipaddr           m_addr{};
        bool             m_resolved{false};
        bool             m_stopped{false};
        size_t           m_leased{0};
        uint64_t         m_acquired{0};
        uint64_t         m_released{0};
    };

    /**
     * The two pools of a client, one per \see PoolClass. They share the
     * configured size, the client can therefore hold twice that many
     * connections at once
     */
    struct Pools {
        Pools(const Endpoint& ep, const PoolConfig& config);

        Pools(const Pools&) = delete;
        Pools& operator=(const Pools&) = delete;

        Pool& operator[](PoolClass cls) {
            return cls == PoolClass::Bounded? *m_bounded : *m_unbounded;
        }

        Lease acquire(PoolClass cls) {
            return Ego[cls].acquire();
        }

        /**
         * shuts down both pools, safe to call more than once
         */
        void shutdown();

        /**
         * @return the total number of connections both pools can hold
         */
        size_t capacity() const {
            return m_bounded->capacity() + m_unbounded->capacity();
        }

        ~Pools() {
            shutdown();
        }

    private:
        Pool::Ptr m_bounded;
        Pool::Ptr m_unbounded;
    };
}

#endif //DOCKWIRE_POOL_H
