//
// Created by dc on 15/11/18.
//

#ifndef DOCKWIRE_PROGRESS_H
#define DOCKWIRE_PROGRESS_H

#include <iod/json.hh>

#include <dockwire/errors.h>
#include <dockwire/http/client.h>

namespace dockwire {

    typedef decltype(iod::D(
        prop(current(var(optional)), int64_t),
        prop(total(var(optional)),   int64_t)
    )) ProgressDetail;

    typedef decltype(iod::D(
        prop(code(var(optional)),    int),
        prop(message(var(optional)), std::string)
    )) ErrorDetail;

    typedef decltype(iod::D(
        prop(ID(var(optional)),     std::string),
        prop(Tag(var(optional)),    std::string),
        prop(Digest(var(optional)), std::string),
        prop(Size(var(optional)),   int64_t)
    )) ProgressAux;

    /**
     * One event of a build, pull or push response body. Every field
     * is optional, absent strings are left empty
     */
    typedef decltype(iod::D(
        prop(status(var(optional)),         std::string),
        prop(id(var(optional)),             std::string),
        prop(progress(var(optional)),       std::string),
        prop(progressDetail(var(optional)), ProgressDetail),
        prop(error(var(optional)),          std::string),
        prop(errorDetail(var(optional)),    ErrorDetail),
        prop(stream(var(optional)),         std::string),
        prop(aux(var(optional)),            ProgressAux)
    )) ProgressMessage;

    /**
     * @return the image id announced by a build event, either as
     * `aux.ID` or in a `Successfully built <id>` stream line. Empty
     * if the event carries none
     */
    std::string buildImageId(const ProgressMessage& msg);

    /**
     * Receives the events of a progress stream
     */
    struct ProgressHandler {
        virtual void progress(const ProgressMessage& msg) = 0;

        virtual ~ProgressHandler() = default;
    };

    define_log_tag(PROGRESS);

    /**
     * The default handler, logs every event
     */
    struct LoggingProgressHandler : ProgressHandler, LOGGER(PROGRESS) {
        LoggingProgressHandler(std::string what = "")
            : m_what(std::move(what))
        {}

        void progress(const ProgressMessage& msg) override;

    private:
        std::string m_what;
    };

    /**
     * Decodes the JSON events of a streaming response body. Events are
     * concatenated JSON objects, the stream buffers body bytes until a
     * complete object is available. The body (and with it the connection)
     * is released once the stream is exhausted, fails or is destroyed
     */
    struct ProgressStream : LOGGER(PROGRESS) {
        ProgressStream(std::unique_ptr<http::BodySource> body, http::Method method, std::string uri);

        ProgressStream(ProgressStream&&) = default;
        ProgressStream& operator=(ProgressStream&&) = default;

        /**
         * blocks until a complete event is buffered or the body ends
         *
         * @return true if \see next will return an event, false once the
         * body ended with no bytes pending. Once false it stays false
         * @throws TimeoutError, InterruptedError or DockerError if reading
         * the body fails
         */
        bool hasNext();

        /**
         * @return the next event
         * @throws DockerError if the stream is exhausted or the event
         * cannot be decoded
         */
        ProgressMessage next();

        /**
         * passes every remaining event to \param handler
         *
         * @return the last build image id found in the events, empty if none
         * @throws DockerError if an event reports an error
         */
        std::string tail(ProgressHandler& handler);

        void close();

        ~ProgressStream() {
            close();
        }

    private:
        size_t scan();

        void fill();

        std::unique_ptr<http::BodySource> m_body{nullptr};
        http::Method m_method;
        std::string  m_uri;
        OBuffer      m_buf{};
        size_t       m_start{0};
        size_t       m_ready{0};
        size_t       m_scanned{0};
        int          m_depth{0};
        bool         m_instr{false};
        bool         m_escape{false};
        bool         m_eof{false};
        bool         m_done{false};
    };
}

#endif //DOCKWIRE_PROGRESS_H
