//
// Created by dc on 16/11/18.
//

#ifndef DOCKWIRE_DOCKER_H
#define DOCKWIRE_DOCKER_H

#include <dockwire/executor.h>
#include <dockwire/logstream.h>
#include <dockwire/progress.h>

namespace dockwire::docker {

    typedef decltype(iod::D(
        prop(username(var(optional)),      std::string),
        prop(password(var(optional)),      std::string),
        prop(email(var(optional)),         std::string),
        prop(serveraddress(var(optional)), std::string)
    )) AuthConfig;

    typedef decltype(iod::D(
        prop(Version(var(optional)),       std::string),
        prop(ApiVersion(var(optional)),    std::string),
        prop(Os(var(optional)),            std::string),
        prop(Arch(var(optional)),          std::string),
        prop(KernelVersion(var(optional)), std::string),
        prop(GoVersion(var(optional)),     std::string),
        prop(GitCommit(var(optional)),     std::string)
    )) Version;

    typedef decltype(iod::D(
        prop(StatusCode(var(optional)), int)
    )) ContainerExit;

    /**
     * An image reference split into its repository and tag. A colon
     * that comes before the last slash belongs to the registry host
     *
     * @code
     * ImageRef ref("registry:5000/busybox:latest");
     * // ref.image() == "registry:5000/busybox", ref.tag() == "latest"
     * @endcode
     */
    struct ImageRef {
        ImageRef(const std::string& image);

        const std::string& image() const { return m_image; }

        /**
         * @return the tag, empty if the reference has none
         */
        const std::string& tag() const { return m_tag; }

    private:
        std::string m_image;
        std::string m_tag{};
    };

    /**
     * @return true if \param name is a valid container name
     */
    bool validContainerName(const std::string& name);

    struct ClientConfig {
        PoolConfig  pool{};
        std::string certPath{};
        std::string apiVersion{"v1.12"};
        AuthConfig  auth{};
        bool        hasAuth{false};

        /**
         * builds a configuration from iod options
         *
         * @param opts any of connectTimeout, readTimeout, poolSize,
         * certPath, auth and apiVersion. Timeouts are in milliseconds,
         * a timeout of 0 or less never expires
         */
        template <typename... Opts>
        static ClientConfig make(Opts... opts) {
            ClientConfig cfg;
            auto options = iod::D(opts...);
            cfg.pool.connectTimeout = options.get(var(connectTimeout), cfg.pool.connectTimeout);
            cfg.pool.readTimeout    = options.get(var(readTimeout), cfg.pool.readTimeout);
            cfg.pool.size           = (size_t) options.get(var(poolSize), cfg.pool.size);
            cfg.certPath            = options.get(var(certPath), cfg.certPath);
            cfg.apiVersion          = options.get(var(apiVersion), cfg.apiVersion);
            if (options.has(var(auth))) {
                cfg.auth = options.get(var(auth), AuthConfig{});
                cfg.hasAuth = true;
            }
            return cfg;
        }
    };

    struct LogsParams {
        bool        follow{false};
        bool        stdOut{false};
        bool        stdErr{false};
        bool        timestamps{false};
    };

    struct AttachParams {
        bool        logs{false};
        bool        stream{false};
        bool        stdIn{false};
        bool        stdOut{false};
        bool        stdErr{false};
    };

    define_log_tag(DOCKER_CLIENT);

    /**
     * A docker remote API client bound to one endpoint.
     *
     * The client keeps two connection pools of `poolSize` connections
     * each, one for requests bounded by the connect timeout and one for
     * calls that block on the server (stop, wait). It can therefore hold
     * up to twice `poolSize` connections at once
     *
     * @code
     * auto client = Client::fromEnv(opt(readTimeout, 10_sec));
     * client->pull("busybox:latest");
     * @endcode
     */
    struct Client : LOGGER(DOCKER_CLIENT) {
        sptr(Client)

        Client(const Endpoint& ep, const ClientConfig& config);

        template <typename... Opts>
        Client(const Endpoint& ep, Opts... opts)
            : Client(ep, ClientConfig::make(opts...))
        {}

        template <typename... Opts>
        Client(const std::string& uri, Opts... opts)
            : Client(Endpoint::parse(uri), ClientConfig::make(opts...))
        {}

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        /**
         * creates a client for the endpoint given by the DOCKER_HOST and
         * DOCKER_CERT_PATH environment variables
         */
        template <typename... Opts>
        static Ptr fromEnv(Opts... opts) {
            Endpoint ep = Endpoint::fromEnv();
            ClientConfig config = ClientConfig::make(opts...);
            if (config.certPath.empty() && ep.isSecure()) {
                config.certPath = ep.certPath();
            }
            return std::make_shared<Client>(ep, config);
        }

        /**
         * makes requests issued from now on interruptible by \param token,
         * nullptr restores uninterruptible requests. Reading the body of a
         * \see LogStream or \see ProgressStream returned after this call is
         * interruptible by the same token
         */
        void interruptWith(Cancellation* token) {
            m_cancel = token;
        }

        std::string ping();

        Version version();

        /**
         * @return the daemon's system information document
         */
        std::string info();

        /**
         * @return the container's json document
         * @throws ContainerNotFoundError
         */
        std::string inspectContainer(const std::string& id);

        /**
         * creates a container
         *
         * @param config the container configuration document
         * @param name the name of the container, empty for a generated name
         * @return the creation response document, holding the container Id
         * @throws ImageNotFoundError if the image to create from is missing
         * @throws Exception (InvalidArguments) if \param name is not valid
         */
        std::string createContainer(const std::string& config, const std::string& name = "");

        void startContainer(const std::string& id);

        /**
         * stops the container, waiting \param secs seconds before it is
         * killed. Stopping a stopped container succeeds
         */
        void stopContainer(const std::string& id, int secs);

        /**
         * blocks until the container exits
         * @return the container's exit code
         */
        int waitContainer(const std::string& id);

        void removeContainer(const std::string& id, bool removeVolumes = false);

        LogStream logs(const std::string& id, const LogsParams& params);

        /**
         * @code
         * auto stream = client.logs(id, opt(stdOut, true), opt(stdErr, true));
         * @endcode
         */
        template <typename... Opts>
        LogStream logs(const std::string& id, Opts... opts) {
            auto options = iod::D(opts...);
            LogsParams params;
            params.follow     = options.get(var(follow), false);
            params.stdOut     = options.get(var(stdOut), false);
            params.stdErr     = options.get(var(stdErr), false);
            params.timestamps = options.get(var(timestamps), false);
            return logs(id, params);
        }

        LogStream attachContainer(const std::string& id, const AttachParams& params);

        template <typename... Opts>
        LogStream attachContainer(const std::string& id, Opts... opts) {
            auto options = iod::D(opts...);
            AttachParams params;
            params.logs   = options.get(var(logs), false);
            params.stream = options.get(var(stream), false);
            params.stdIn  = options.get(var(stdIn), false);
            params.stdOut = options.get(var(stdOut), false);
            params.stdErr = options.get(var(stdErr), false);
            return attachContainer(id, params);
        }

        void pull(const std::string& image);

        void pull(const std::string& image, ProgressHandler& handler);

        void push(const std::string& image);

        void push(const std::string& image, ProgressHandler& handler);

        /**
         * builds an image from a tar archive of the build context
         *
         * @param archive path to the tar archive
         * @param name the name to tag the image with, empty for none
         * @return the id of the built image, empty if the daemon did
         * not report one
         */
        std::string build(const std::string& archive, const std::string& name = "");

        std::string build(const std::string& archive, const std::string& name, ProgressHandler& handler);

        /**
         * @return the image's json document
         * @throws ImageNotFoundError
         */
        std::string inspectImage(const std::string& image);

        const Endpoint& endpoint() const {
            return m_executor.endpoint();
        }

        const ClientConfig& config() const {
            return m_config;
        }

        Pools& pools() {
            return m_executor.pools();
        }

        /**
         * shuts down both connection pools, safe to call more than once
         */
        void close();

        ~Client() {
            close();
        }

    private:
        std::string resource(const std::string& path) const;

        std::string authHeader() const;

        std::unique_ptr<http::BodySource> interruptible(http::Response&& resp) const;

        std::string fetch(http::Request&& req, PoolClass cls = PoolClass::Bounded);

        ProgressStream progress(http::Request&& req);

        LogStream stream(http::Request&& req);

        ClientConfig  m_config;
        Executor      m_executor;
        Cancellation *m_cancel{nullptr};
        bool          m_closed{false};
    };
}

#endif //DOCKWIRE_DOCKER_H
