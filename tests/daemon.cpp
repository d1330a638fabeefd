//
// Created by dc on 17/11/18.
//

#include <arpa/inet.h>
#include <sstream>
#include <unistd.h>

#include <dockwire/http.h>

#include "daemon.h"

namespace dockwire::test {

    static std::string statusLine(int status) {
        const char *text = http::status_text((http::Status) status);
        if (text[0] == '\0') {
            return utils::catstr("HTTP/1.1 ", status, " Unknown\r\n");
        }
        return utils::catstr("HTTP/1.1 ", text, "\r\n");
    }

    std::string reply(int status, const std::string &body, const std::string &headers) {
        return utils::catstr(statusLine(status),
                             "Content-Length: ", body.size(), "\r\n",
                             headers,
                             "\r\n",
                             body);
    }

    std::string chunked(int status, const std::vector<std::string> &chunks, const std::string &headers) {
        std::stringstream ss;
        ss << statusLine(status)
           << "Transfer-Encoding: chunked\r\n"
           << headers
           << "\r\n";
        for (auto& chunk: chunks) {
            ss << std::hex << chunk.size() << "\r\n" << chunk << "\r\n";
        }
        ss << "0\r\n\r\n";
        return ss.str();
    }

    std::string frames(const std::vector<std::pair<uint8_t, std::string>> &frames) {
        std::string out{};
        for (auto& frame: frames) {
            char hdr[8] = {0};
            hdr[0] = (char) frame.first;
            uint32_t len = htonl((uint32_t) frame.second.size());
            memcpy(&hdr[4], &len, sizeof(len));
            out.append(hdr, sizeof(hdr));
            out += frame.second;
        }
        return out;
    }

    MockDaemon::MockDaemon(Script script)
        : m_script(std::move(script))
    {
        char tmpl[] = "/tmp/dockwire-XXXXXX";
        if (mkdtemp(tmpl) == nullptr) {
            throw Exception::create("creating mock daemon directory failed: ", errno_s);
        }
        m_dir  = tmpl;
        m_path = m_dir + "/docker.sock";

        m_sock = unixlisten(m_path.c_str(), 16);
        if (m_sock == nullptr) {
            throw Exception::create("mock daemon listen on '", m_path, "' failed: ", errno_s);
        }
        go(accept(this));
    }

    void MockDaemon::accept(MockDaemon *d) {
        d->m_active++;
        while (!d->m_stopped) {
            unixsock conn = unixaccept(d->m_sock, mnow() + 20);
            if (conn == nullptr) {
                continue;
            }
            d->m_connections++;
            go(serve(d, conn));
        }
        d->m_active--;
    }

    bool MockDaemon::respond(unixsock conn, Exchange &ex) {
        auto it = ex.headers.find("Content-Length");
        if (it != ex.headers.end()) {
            size_t len = std::stoul(it->second);
            ex.body.resize(len);
            if (len > 0) {
                unixrecv(conn, &ex.body[0], len, mnow() + 5000);
                if (errno != 0) {
                    return false;
                }
            }
        }

        exchanges.push_back(ex);
        Reply r = m_script(ex);
        if (r.delay > 0) {
            msleep(mnow() + r.delay);
        }

        unixsend(conn, r.raw.data(), r.raw.size(), -1);
        if (errno != 0) {
            return false;
        }
        unixflush(conn, -1);
        return errno == 0 && !r.close;
    }

    void MockDaemon::serve(MockDaemon *d, unixsock conn) {
        d->m_active++;
        Exchange    ex{};
        std::string line{};
        while (!d->m_stopped) {
            char buf[1024];
            size_t nrd = unixrecvuntil(conn, buf, sizeof(buf), "\n", 1, mnow() + 20);
            int err = errno;
            line.append(buf, nrd);
            if (err == ETIMEDOUT || err == ENOBUFS) {
                // line incomplete
                continue;
            }
            if (err != 0) {
                break;
            }

            if (ex.method.empty()) {
                // request line
                auto sp1 = line.find(' ');
                auto sp2 = line.find(' ', sp1+1);
                ex.method = line.substr(0, sp1);
                ex.target = line.substr(sp1+1, sp2-sp1-1);
            }
            else if (line == "\r\n") {
                bool keep = d->respond(conn, ex);
                ex = Exchange{};
                if (!keep) {
                    break;
                }
            }
            else {
                auto colon = line.find(':');
                std::string value = line.substr(colon+1);
                while (!value.empty() && isspace(value.front())) value.erase(0, 1);
                while (!value.empty() && isspace(value.back())) value.pop_back();
                ex.headers[line.substr(0, colon)] = value;
            }
            line.clear();
        }
        unixclose(conn);
        d->m_active--;
    }

    void MockDaemon::stop() {
        if (m_stopped) {
            return;
        }

        m_stopped = true;
        while (m_active > 0) {
            msleep(mnow() + 10);
        }

        unixclose(m_sock);
        m_sock = nullptr;
        ::unlink(m_path.c_str());
        ::rmdir(m_dir.c_str());
    }

    MockDaemon::~MockDaemon() {
        stop();
    }
}
