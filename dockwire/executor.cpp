//
// Created by dc on 14/11/18.
//

#include <algorithm>
#include <vector>

#include "executor.h"

namespace dockwire {

    Cancellation::Cancellation()
        : m_ch(chmake(char, 1))
    {
        if (m_ch == nullptr) {
            throw Exception::create("creating cancellation channel failed: ", errno_s);
        }
    }

    void Cancellation::cancel() {
        if (!m_cancelled) {
            m_cancelled = true;
            chdone(m_ch, char, 1);
        }
    }

    Cancellation::~Cancellation() {
        if (m_ch) {
            chclose(m_ch);
            m_ch = nullptr;
        }
    }

    struct InterruptibleBody::Pending {
        std::unique_ptr<http::BodySource> body;
        std::vector<char>  buf{};
        size_t             nrd{0};
        std::exception_ptr failure{nullptr};
        bool               busy{false};
    };

    InterruptibleBody::InterruptibleBody(std::unique_ptr<http::BodySource> body, Cancellation *cancel)
        : m_pending(std::make_shared<Pending>()),
          m_cancel(cancel)
    {
        m_pending->body = std::move(body);
    }

    void InterruptibleBody::pump(std::shared_ptr<Pending> pending, chan done) {
        try {
            pending->nrd = pending->body->read(pending->buf.data(), pending->buf.size());
        }
        catch (...) {
            // handed over to the waiting reader
            pending->failure = std::current_exception();
        }

        chs(done, int, 1);
        chclose(done);
    }

    size_t InterruptibleBody::read(void *buf, size_t len) {
        if (m_cancel == nullptr) {
            return m_pending->body->read(buf, len);
        }

        if (m_pending->busy || m_cancel->cancelled()) {
            // an abandoned read still owns the body
            throw InterruptedIO("reading response body interrupted");
        }

        chan done = chmake(int, 1);
        if (done == nullptr) {
            throw Exception::create("creating read channel failed: ", errno_s);
        }

        m_pending->buf.resize(std::max<size_t>(len, 1));
        m_pending->busy = true;
        go(pump(m_pending, chdup(done)));

        bool interrupted{false};
        choose {
            chin(done, int, res):
                (void) res;
            chin(m_cancel->channel(), char, sig):
                (void) sig;
                interrupted = true;
        chend
        }
        chclose(done);

        if (interrupted) {
            idebug("reading response body interrupted");
            throw InterruptedIO("reading response body interrupted");
        }

        m_pending->busy = false;
        if (m_pending->failure != nullptr) {
            auto failure = m_pending->failure;
            m_pending->failure = nullptr;
            std::rethrow_exception(failure);
        }

        size_t nrd = std::min(m_pending->nrd, len);
        memcpy(buf, m_pending->buf.data(), nrd);
        return nrd;
    }

    struct Executor::Task : LOGGER(EXECUTOR) {
        Task(http::Request&& req, Pool::Ptr pool, std::string host)
            : request(std::move(req)),
              pool(std::move(pool)),
              host(std::move(host))
        {}

        http::Request      request;
        Pool::Ptr          pool;
        std::string        host;
        http::Response     response{};
        std::exception_ptr failure{nullptr};
    };

    Executor::Executor(const Endpoint &ep, const PoolConfig &config)
        : m_endpoint(ep),
          m_pools(ep, config)
    {}

    static bool stale(const std::exception& ex) {
        // timeouts and interruptions are not caused by a dead connection
        return dynamic_cast<const ReadTimeout*>(&ex) == nullptr &&
               dynamic_cast<const InterruptedIO*>(&ex) == nullptr &&
               dynamic_cast<const ResponseError*>(&ex) == nullptr;
    }

    void Executor::roundtrip(Task &task) {
        while (true) {
            Lease lease = task.pool->acquire();
            bool reused = lease.reused();
            http::Response resp;
            try {
                task.request.submit(lease.sock(), task.host, lease.readTimeout());
                resp.receive(std::move(lease));
                task.response = std::move(resp);
                return;
            }
            catch (const std::exception& ex) {
                if (lease) {
                    lease.discard();
                    lease.release();
                }

                if (!reused || resp.started() || !stale(ex)) {
                    throw;
                }
                // the server closed an idle connection, the next attempt
                // drains the idle list or connects anew
                ldebug(&task, "reused connection failed before a response: %s", ex.what());
            }
        }
    }

    void Executor::dispatch(std::shared_ptr<Task> task, chan done) {
        try {
            try {
                roundtrip(*task);
            }
            catch (const std::exception&) {
                std::throw_with_nested(
                        Exception::create(http::method_name(task->request.method()), " ",
                                          task->request.target(), " failed"));
            }
        }
        catch (...) {
            // handed over to the waiting caller
            task->failure = std::current_exception();
        }

        chs(done, int, 1);
        chclose(done);
    }

    http::Response Executor::execute(http::Request &&req, PoolClass cls, Cancellation *cancel) {
        http::Method method = req.method();
        std::string  target = uri(req.target());
        if (cancel != nullptr && cancel->cancelled()) {
            throw InterruptedError(method, target);
        }

        auto task = std::make_shared<Task>(std::move(req),
                                           m_pools[cls].shared_from_this(),
                                           m_endpoint.hostHeader());
        chan done = chmake(int, 1);
        if (done == nullptr) {
            throw DockerError(utils::catstr("creating request channel failed: ", errno_s));
        }

        trace("%s %s on the %s pool", http::method_name(method), target.c_str(), poolclass_name(cls));
        go(dispatch(task, chdup(done)));

        bool interrupted{false};
        if (cancel == nullptr) {
            (void) chr(done, int);
        }
        else {
            choose {
                chin(done, int, res):
                    (void) res;
                chin(cancel->channel(), char, sig):
                    (void) sig;
                    interrupted = true;
            chend
            }
        }
        chclose(done);

        if (interrupted) {
            // the request keeps running and releases its connection when done
            idebug("%s %s interrupted", http::method_name(method), target.c_str());
            throw InterruptedError(method, target);
        }

        if (task->failure != nullptr) {
            propagate(task->failure, method, target);
        }

        return std::move(task->response);
    }

    http::Response Executor::execute(http::Method method, const std::string &target, PoolClass cls,
                                     const strview &body, Cancellation *cancel)
    {
        http::Request req(method, target);
        if (!body.empty()) {
            req.body(body);
        }
        return execute(std::move(req), cls, cancel);
    }
}
