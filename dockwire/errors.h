//
// Created by dc on 13/11/18.
//

#ifndef DOCKWIRE_ERRORS_H
#define DOCKWIRE_ERRORS_H

#include <exception>

#include <dockwire/base.h>
#include <dockwire/http.h>

namespace dockwire {

    namespace errors {
        static constexpr int ConnectTimeout      = 30;
        static constexpr int ReadTimeout         = 31;
        static constexpr int InterruptedIO       = 32;
        static constexpr int ResponseError       = 33;
        static constexpr int DockerError         = 40;
        static constexpr int RequestError        = 41;
        static constexpr int TimeoutError        = 42;
        static constexpr int NotFound            = 43;
        static constexpr int Interrupted         = 44;
    }

    /**
     * Establishing a connection, or waiting for a pooled one, did not
     * complete in time
     */
    struct ConnectTimeout : Exception {
        ConnectTimeout(std::string&& msg)
            : Exception(std::move(msg), errors::ConnectTimeout)
        {}
    };

    /**
     * The remote did not send anything within the read timeout
     */
    struct ReadTimeout : Exception {
        ReadTimeout(std::string&& msg)
            : Exception(std::move(msg), errors::ReadTimeout)
        {}
    };

    /**
     * A blocking socket operation was interrupted (EINTR/ECANCELED)
     */
    struct InterruptedIO : Exception {
        InterruptedIO(std::string&& msg)
            : Exception(std::move(msg), errors::InterruptedIO)
        {}
    };

    /**
     * The server answered with an error status, the body has been
     * read as text (empty if it could not be read)
     */
    struct ResponseError : Exception {
        ResponseError(int status, std::string body)
            : Exception(describe(status), errors::ResponseError),
              m_status(status),
              m_body(std::move(body))
        {}

        int status() const { return m_status; }

        const std::string& body() const { return m_body; }

    private:
        static std::string describe(int status) {
            return "server responded with status " + std::to_string(status);
        }

        int         m_status;
        std::string m_body;
    };

    /**
     * Generic docker client failure, the base of every error reported
     * by client operations except \see InterruptedError
     */
    struct DockerError : Exception {
        DockerError(std::string&& msg, std::exception_ptr cause = nullptr, int code = errors::DockerError)
            : Exception(std::move(msg), code),
              m_cause(std::move(cause))
        {}

        /**
         * wraps the given failure, the message is taken from it
         */
        static DockerError wrap(std::exception_ptr cause);

        /**
         * @return the failure that caused this error, may be null
         */
        const std::exception_ptr& cause() const { return m_cause; }

    private:
        std::exception_ptr m_cause{nullptr};
    };

    /**
     * The docker daemon rejected a request
     */
    struct RequestError : DockerError {
        RequestError(http::Method method, std::string uri, int status,
                     std::string message, std::exception_ptr cause = nullptr);

        int status() const { return m_status; }

        http::Method method() const { return m_method; }

        const std::string& uri() const { return m_uri; }

        /**
         * @return the response body sent by the daemon
         */
        const std::string& message() const { return m_message; }

    private:
        http::Method m_method;
        std::string  m_uri;
        int          m_status;
        std::string  m_message;
    };

    struct TimeoutError : DockerError {
        TimeoutError(http::Method method, std::string uri, std::exception_ptr cause = nullptr);

        http::Method method() const { return m_method; }

        const std::string& uri() const { return m_uri; }

    private:
        http::Method m_method;
        std::string  m_uri;
    };

    struct ContainerNotFoundError : DockerError {
        ContainerNotFoundError(std::string id, std::exception_ptr cause = nullptr);

        const std::string& containerId() const { return m_id; }

    private:
        std::string m_id;
    };

    struct ImageNotFoundError : DockerError {
        ImageNotFoundError(std::string image, std::exception_ptr cause = nullptr);

        const std::string& image() const { return m_image; }

    private:
        std::string m_image;
    };

    /**
     * Raised when the waiting caller is cancelled, this is not a DockerError
     */
    struct InterruptedError : Exception {
        InterruptedError(http::Method method, const std::string& uri);
    };

    /**
     * Walks the failure's nested exception chain from the outermost failure
     * inwards and maps the first match onto a client error:
     *  - a server response becomes a RequestError carrying its status
     *  - read and connect timeouts become a TimeoutError
     *  - interrupted I/O becomes an InterruptedError
     * A chain without any match is wrapped as a DockerError, failures that
     * are already client errors are returned untouched
     *
     * @param failure the failure to classify
     * @param method the method of the failed request
     * @param uri the request uri
     * @return the classified error, never null
     */
    std::exception_ptr classify(std::exception_ptr failure, http::Method method, const std::string& uri);

    /**
     * classifies the failure (\see classify) and throws the result
     */
    [[noreturn]] void propagate(std::exception_ptr failure, http::Method method, const std::string& uri);
}

#endif //DOCKWIRE_ERRORS_H
