//
// Created by dc on 14/11/18.
//

#ifndef DOCKWIRE_EXECUTOR_H
#define DOCKWIRE_EXECUTOR_H

#include <dockwire/errors.h>
#include <dockwire/http/client.h>

namespace dockwire {

    /**
     * Lets a caller blocked in \see Executor::execute, or in a read of
     * an \see InterruptibleBody, give up waiting. Cancelling wakes every
     * waiter, the token stays cancelled.
     *
     * Only the waiter is released. The coroutine doing the I/O keeps its
     * connection until the daemon answers or the read timeout expires,
     * the connection is then discarded. A pool whose read timeout is
     * disabled can therefore stay occupied by abandoned requests
     */
    struct Cancellation {
        Cancellation();

        Cancellation(const Cancellation&) = delete;
        Cancellation& operator=(const Cancellation&) = delete;

        void cancel();

        bool cancelled() const {
            return m_cancelled;
        }

        chan channel() const {
            return m_ch;
        }

        ~Cancellation();

    private:
        chan m_ch{nullptr};
        bool m_cancelled{false};
    };

    define_log_tag(EXECUTOR);

    /**
     * A response body whose reads can be interrupted. Each read runs on
     * its own coroutine while the caller waits for either the read or
     * the cancellation token. Without a token reads go straight to the
     * wrapped body
     */
    struct InterruptibleBody : http::BodySource, LOGGER(EXECUTOR) {
        InterruptibleBody(std::unique_ptr<http::BodySource> body, Cancellation* cancel);

        InterruptibleBody(const InterruptibleBody&) = delete;
        InterruptibleBody& operator=(const InterruptibleBody&) = delete;

        /**
         * @throws InterruptedIO if the token is (or gets) cancelled, the
         * body cannot be read any further after that
         */
        size_t read(void *buf, size_t len) override;

    private:
        struct Pending;

        static coroutine void pump(std::shared_ptr<Pending> pending, chan done);

        std::shared_ptr<Pending> m_pending;
        Cancellation            *m_cancel{nullptr};
    };

    /**
     * Issues requests against the connection pools of an endpoint. The
     * request runs on its own coroutine while the caller waits for it
     * to complete, failures are classified (\see classify) before they
     * reach the caller
     */
    struct Executor : LOGGER(EXECUTOR) {
        Executor(const Endpoint& ep, const PoolConfig& config);

        Executor(const Executor&) = delete;
        Executor& operator=(const Executor&) = delete;

        /**
         * executes the given request on a connection of the \param cls pool
         *
         * @param req the request to execute
         * @param cls the pool to execute on
         * @param cancel an optional token which interrupts the wait
         * @return the response, its body is still to be read
         *
         * @throws RequestError, TimeoutError or DockerError if the request failed
         * @throws InterruptedError if \param cancel was cancelled while waiting
         */
        http::Response execute(http::Request&& req, PoolClass cls, Cancellation* cancel = nullptr);

        http::Response execute(http::Method method,
                               const std::string& target,
                               PoolClass cls,
                               const strview& body = strview{},
                               Cancellation* cancel = nullptr);

        /**
         * @return the uri of the given target on this executor's endpoint
         */
        std::string uri(const std::string& target) const {
            return m_endpoint.uri() + target;
        }

        const Endpoint& endpoint() const { return m_endpoint; }

        Pools& pools() { return m_pools; }

        void shutdown() {
            m_pools.shutdown();
        }

    private:
        struct Task;

        static coroutine void dispatch(std::shared_ptr<Task> task, chan done);

        static void roundtrip(Task& task);

        Endpoint m_endpoint;
        Pools    m_pools;
    };
}

#endif //DOCKWIRE_EXECUTOR_H
