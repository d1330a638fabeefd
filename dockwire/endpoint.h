//
// Created by dc on 12/11/18.
//

#ifndef DOCKWIRE_ENDPOINT_H
#define DOCKWIRE_ENDPOINT_H

#include <dockwire/base.h>

namespace dockwire {

    /**
     * The single destination a client is bound to. Unix socket endpoints
     * are addressed for HTTP purposes as `unix://localhost:80`, the real
     * socket path is kept aside for the transport
     */
    struct Endpoint {

        static constexpr const char *DEFAULT_UNIX_ENDPOINT = "unix:///var/run/docker.sock";
        static constexpr const char *DEFAULT_HOST = "localhost";
        static constexpr int DEFAULT_PORT = 2375;

        /**
         * parses an endpoint uri, one of `http://host:port`, `https://host:port`
         * or `unix:///abs/path`
         * @param uri the uri to parse
         * @return the parsed endpoint
         * @throws Exception (InvalidArguments) if the uri is not supported
         */
        static Endpoint parse(const std::string& uri);

        /**
         * builds an endpoint from the DOCKER_HOST and DOCKER_CERT_PATH
         * environment variables
         */
        static Endpoint fromEnv();

        /**
         * builds an endpoint the way \see fromEnv does, from explicit values
         * @param host the value of DOCKER_HOST, empty if unset
         * @param certPath the value of DOCKER_CERT_PATH, empty if unset
         */
        static Endpoint fromEnv(const std::string& host, const std::string& certPath);

        /**
         * @return the endpoint used when DOCKER_HOST is not set
         */
        static const char* defaultEndpoint();

        const std::string& scheme() const { return m_scheme; }

        const std::string& host() const { return m_host; }

        int port() const { return m_port; }

        /**
         * @return the socket file for unix endpoints, empty otherwise
         */
        const std::string& socketPath() const { return m_path; }

        bool isUnix() const { return m_scheme == "unix"; }

        bool isSecure() const { return m_scheme == "https"; }

        /**
         * @return the uri used for HTTP routing
         */
        const std::string& uri() const { return m_uri; }

        /**
         * @return the value sent on the Host header
         */
        std::string hostHeader() const;

        /**
         * certificate directory that came with the endpoint (DOCKER_CERT_PATH)
         */
        const std::string& certPath() const { return m_certPath; }

    private:
        Endpoint(std::string scheme, std::string host, int port, std::string path);

        std::string m_scheme{};
        std::string m_host{};
        int         m_port{0};
        std::string m_path{};
        std::string m_uri{};
        std::string m_certPath{};
    };
}

#endif //DOCKWIRE_ENDPOINT_H
