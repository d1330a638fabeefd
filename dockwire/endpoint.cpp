//
// Created by dc on 12/11/18.
//

#include <cstdlib>

#include "endpoint.h"
#include "utils.h"

namespace dockwire {

    static int parsePort(const std::string& uri, const std::string& port) {
        if (port.empty() || port.size() > 5 ||
            port.find_first_not_of("0123456789") != std::string::npos)
        {
            throw Exception::invalidArguments("endpoint '", uri, "' has an invalid port '", port, "'");
        }

        int p = std::stoi(port);
        if (p <= 0 || p > 65535) {
            throw Exception::invalidArguments("endpoint '", uri, "' port ", p, " out of range");
        }
        return p;
    }

    Endpoint::Endpoint(std::string scheme, std::string host, int port, std::string path)
        : m_scheme(std::move(scheme)),
          m_host(std::move(host)),
          m_port(port),
          m_path(std::move(path))
    {
        m_uri = utils::catstr(m_scheme, "://", m_host, ":", m_port);
    }

    Endpoint Endpoint::parse(const std::string &uri) {
        auto pos = uri.find("://");
        if (pos == std::string::npos || pos == 0) {
            throw Exception::invalidArguments("endpoint '", uri, "' has no scheme");
        }

        std::string scheme = uri.substr(0, pos);
        std::string rest   = uri.substr(pos+3);
        if (scheme == "unix") {
            // unix:///path and unix://localhost/path name the same socket
            if (utils::startswith(rest, "localhost/"))
                rest = rest.substr(sizeofcstr("localhost"));

            if (rest.empty() || rest[0] != '/') {
                throw Exception::invalidArguments("unix endpoint '", uri, "' must be an absolute path");
            }
            return Endpoint("unix", "localhost", 80, rest);
        }

        if (scheme != "http" && scheme != "https") {
            throw Exception::invalidArguments("endpoint scheme '", scheme, "' is not supported");
        }

        // drop any path component
        auto slash = rest.find('/');
        if (slash != std::string::npos) {
            rest = rest.substr(0, slash);
        }

        std::string host{rest};
        int port{DEFAULT_PORT};
        auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            host = rest.substr(0, colon);
            port = parsePort(uri, rest.substr(colon+1));
        }

        if (host.empty()) {
            throw Exception::invalidArguments("endpoint '", uri, "' has no host");
        }

        return Endpoint(std::move(scheme), std::move(host), port, "");
    }

    const char* Endpoint::defaultEndpoint() {
#ifdef __linux__
        return DEFAULT_UNIX_ENDPOINT;
#else
        return "localhost:2375";
#endif
    }

    Endpoint Endpoint::fromEnv(const std::string &dockerHost, const std::string &certPath) {
        std::string endpoint = dockerHost.empty()? defaultEndpoint() : dockerHost;
        if (utils::startswith(endpoint, "unix://")) {
            auto ep = parse(endpoint);
            ep.m_certPath = certPath;
            return ep;
        }

        // tcp://host:port, host:port or just host
        auto pos = endpoint.find("://");
        std::string stripped = pos == std::string::npos? endpoint : endpoint.substr(pos+3);
        auto slash = stripped.find('/');
        if (slash != std::string::npos) {
            stripped = stripped.substr(0, slash);
        }

        std::string host{stripped};
        int port{DEFAULT_PORT};
        auto colon = stripped.rfind(':');
        if (colon != std::string::npos) {
            host = stripped.substr(0, colon);
            port = parsePort(endpoint, stripped.substr(colon+1));
        }

        if (host.empty()) {
            host = DEFAULT_HOST;
        }

        Endpoint ep(certPath.empty()? "http" : "https", std::move(host), port, "");
        ep.m_certPath = certPath;
        return ep;
    }

    Endpoint Endpoint::fromEnv() {
        const char *host = getenv("DOCKER_HOST");
        const char *certPath = getenv("DOCKER_CERT_PATH");
        return fromEnv(host? host : "", certPath? certPath : "");
    }

    std::string Endpoint::hostHeader() const {
        if (isUnix()) {
            return "localhost";
        }
        return utils::catstr(m_host, ":", m_port);
    }
}
