//
// Created by dc on 15/11/18.
//

#include <arpa/inet.h>

#include "logstream.h"

namespace dockwire {

    LogStream::LogStream(std::unique_ptr<http::BodySource> body, http::Method method, std::string uri)
        : m_body(std::move(body)),
          m_method(method),
          m_uri(std::move(uri))
    {}

    size_t LogStream::fill(char *buf, size_t len) {
        size_t total{0};
        while (total < len) {
            size_t nrd = m_body->read(&buf[total], len - total);
            if (nrd == 0) {
                break;
            }
            total += nrd;
        }
        return total;
    }

    bool LogStream::next(LogFrame &frame) {
        if (m_body == nullptr) {
            return false;
        }

        char hdr[LogFrame::HEADER_SIZE];
        size_t nrd = fill(hdr, sizeof(hdr));
        if (nrd == 0) {
            close();
            return false;
        }

        if (nrd != sizeof(hdr)) {
            throw Exception::protocolError("truncated frame header, ", nrd, " of ",
                                           sizeof(hdr), " bytes available");
        }

        uint32_t len{0};
        memcpy(&len, &hdr[4], sizeof(len));
        len = ntohl(len);

        frame.type = (uint8_t) hdr[0];
        frame.payload.resize(len);
        if (len > 0) {
            nrd = fill(&frame.payload[0], len);
            if (nrd != len) {
                throw Exception::protocolError("frame declares ", len, " bytes but only ",
                                               nrd, " are available");
            }
        }
        return true;
    }

    void LogStream::attach(std::ostream &out, std::ostream &err) {
        try {
            LogFrame frame;
            while (next(frame)) {
                switch (frame.type) {
                    case LogFrame::Stdout:
                        out.write(frame.payload.data(), frame.payload.size());
                        if (!out) {
                            throw Exception::create("writing to the stdout sink failed");
                        }
                        break;
                    case LogFrame::Stderr:
                        err.write(frame.payload.data(), frame.payload.size());
                        if (!err) {
                            throw Exception::create("writing to the stderr sink failed");
                        }
                        break;
                    default:
                        trace("dropping %lu bytes tagged %d", frame.payload.size(), frame.type);
                        break;
                }
            }
            out.flush();
            err.flush();
        }
        catch (const std::exception&) {
            close();
            propagate(std::current_exception(), m_method, m_uri);
        }
    }

    std::string LogStream::readFully() {
        std::string output{};
        try {
            LogFrame frame;
            while (next(frame)) {
                if (frame.type == LogFrame::Stdout || frame.type == LogFrame::Stderr) {
                    output += frame.payload;
                }
            }
        }
        catch (const std::exception&) {
            close();
            propagate(std::current_exception(), m_method, m_uri);
        }
        return output;
    }
}
