//
// Created by dc on 15/11/18.
//

#include <cctype>

#include "progress.h"

namespace dockwire {

    std::string buildImageId(const ProgressMessage &msg) {
        if (!msg.aux.ID.empty()) {
            return msg.aux.ID;
        }

        static constexpr const char *BUILT = "Successfully built ";
        if (utils::startswith(msg.stream, BUILT)) {
            std::string id = msg.stream.substr(sizeofcstr("Successfully built "));
            while (!id.empty() && isspace((unsigned char) id.back())) {
                id.pop_back();
            }
            return id;
        }

        return "";
    }

    void LoggingProgressHandler::progress(const ProgressMessage &msg) {
        const char *what = m_what.c_str();
        if (!msg.error.empty()) {
            ierror("%s error: %s", what, msg.error.c_str());
        }
        else if (!msg.stream.empty()) {
            std::string line{msg.stream};
            while (!line.empty() && isspace((unsigned char) line.back())) {
                line.pop_back();
            }
            idebug("%s %s", what, line.c_str());
        }
        else if (!msg.id.empty()) {
            idebug("%s %s: %s %s", what, msg.id.c_str(), msg.status.c_str(), msg.progress.c_str());
        }
        else {
            idebug("%s %s", what, msg.status.c_str());
        }
    }

    ProgressStream::ProgressStream(std::unique_ptr<http::BodySource> body, http::Method method, std::string uri)
        : m_body(std::move(body)),
          m_method(method),
          m_uri(std::move(uri))
    {}

    size_t ProgressStream::scan() {
        const char *data = m_buf.data();
        size_t size = m_buf.size();
        while (m_scanned < size) {
            char c = data[m_scanned++];
            if (m_depth == 0) {
                if (isspace((unsigned char) c)) {
                    continue;
                }
                if (c != '{' && c != '[') {
                    throw Exception::protocolError("unexpected character '", c, "' in progress stream");
                }
                m_start = m_scanned - 1;
                m_depth = 1;
                continue;
            }

            if (m_instr) {
                if (m_escape)
                    m_escape = false;
                else if (c == '\\')
                    m_escape = true;
                else if (c == '"')
                    m_instr = false;
                continue;
            }

            switch (c) {
                case '"':
                    m_instr = true;
                    break;
                case '{':
                case '[':
                    m_depth++;
                    break;
                case '}':
                case ']':
                    if (--m_depth == 0) {
                        return m_scanned;
                    }
                    break;
                default:
                    break;
            }
        }

        return 0;
    }

    void ProgressStream::fill() {
        char buf[4096];
        size_t nrd = m_body->read(buf, sizeof(buf));
        if (nrd == 0) {
            m_eof = true;
        }
        else {
            m_buf.append(buf, nrd);
        }
    }

    bool ProgressStream::hasNext() {
        if (m_ready > 0) {
            return true;
        }

        if (m_done) {
            return false;
        }

        try {
            while ((m_ready = scan()) == 0) {
                if (m_eof) {
                    if (m_depth != 0) {
                        throw Exception::protocolError("progress stream ended within a message, ",
                                                       m_buf.size() - m_start, " bytes pending");
                    }
                    trace("progress stream %s exhausted", m_uri.c_str());
                    close();
                    return false;
                }
                fill();
            }
            return true;
        }
        catch (const std::exception&) {
            close();
            propagate(std::current_exception(), m_method, m_uri);
        }
    }

    ProgressMessage ProgressStream::next() {
        if (!hasNext()) {
            throw DockerError(utils::catstr("no more progress messages from ", m_uri));
        }

        std::string record(m_buf.data() + m_start, m_ready - m_start);
        m_buf.consume(m_ready);
        m_start = m_ready = m_scanned = 0;

        ProgressMessage msg{};
        try {
            iod::stringview str(record.data(), record.size());
            iod::json_decode(msg, str);
        }
        catch (const std::exception& ex) {
            throw DockerError(utils::catstr("decoding progress message failed: ", ex.what()),
                              std::current_exception());
        }
        return msg;
    }

    std::string ProgressStream::tail(ProgressHandler &handler) {
        std::string imageId{};
        while (hasNext()) {
            ProgressMessage msg = next();
            std::string id = buildImageId(msg);
            if (!id.empty()) {
                imageId = std::move(id);
            }

            handler.progress(msg);
            if (!msg.error.empty()) {
                close();
                throw DockerError(utils::catstr(http::method_name(m_method), " ", m_uri, ": ", msg.error));
            }
        }

        return imageId;
    }

    void ProgressStream::close() {
        m_done = true;
        m_ready = 0;
        // returns the connection to its pool
        m_body = nullptr;
    }
}
