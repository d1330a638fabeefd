//
// Created by dc on 15/11/18.
//

#ifndef DOCKWIRE_LOGSTREAM_H
#define DOCKWIRE_LOGSTREAM_H

#include <ostream>

#include <dockwire/errors.h>
#include <dockwire/http/client.h>

namespace dockwire {

    /**
     * One frame of a multiplexed log or attach body
     *  [type:1][0:3][length:4 big endian][payload:length]
     */
    struct LogFrame {
        enum Stream : uint8_t {
            Stdin  = 0,
            Stdout = 1,
            Stderr = 2
        };

        static constexpr size_t HEADER_SIZE = 8;

        uint8_t     type{Stdin};
        std::string payload{};
    };

    define_log_tag(LOG_STREAM);

    /**
     * Splits a multiplexed body into its stdout and stderr streams. The
     * body is released as soon as it is exhausted or fails
     */
    struct LogStream : LOGGER(LOG_STREAM) {
        LogStream(std::unique_ptr<http::BodySource> body, http::Method method, std::string uri);

        LogStream(LogStream&&) = default;
        LogStream& operator=(LogStream&&) = default;

        /**
         * reads the next frame
         * @param frame receives the frame
         * @return false once the body ended on a frame boundary
         * @throws Exception (ProtocolError) if the body ends within a frame
         */
        bool next(LogFrame& frame);

        /**
         * writes each frame's payload to the stream it was tagged with
         * until the body ends, stdin and unknown frames are dropped
         *
         * @throws DockerError if the body is malformed or a sink fails,
         * TimeoutError or InterruptedError if reading fails
         */
        void attach(std::ostream& out, std::ostream& err);

        /**
         * @return the stdout and stderr payloads in arrival order
         */
        std::string readFully();

        void close() {
            m_body = nullptr;
        }

        ~LogStream() {
            close();
        }

    private:
        size_t fill(char *buf, size_t len);

        std::unique_ptr<http::BodySource> m_body{nullptr};
        http::Method m_method;
        std::string  m_uri;
    };
}

#endif //DOCKWIRE_LOGSTREAM_H
