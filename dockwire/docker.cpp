//
// Created by dc on 16/11/18.
//

#include <cctype>

#include "docker.h"

namespace dockwire::docker {

    ImageRef::ImageRef(const std::string &image)
    {
        auto colon = image.rfind(':');
        auto slash = image.rfind('/');
        if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
            // no tag, the colon is the registry port
            m_image = image;
        }
        else {
            m_image = image.substr(0, colon);
            m_tag   = image.substr(colon+1);
        }
    }

    bool validContainerName(const std::string &name) {
        size_t i{0};
        if (!name.empty() && name[0] == '/') {
            i++;
        }

        if (i == name.size()) {
            return false;
        }

        for (; i < name.size(); i++) {
            auto c = (unsigned char) name[i];
            if (!isalnum(c) && c != '_' && c != '-') {
                return false;
            }
        }
        return true;
    }

    template <typename T>
    static T decode(const std::string& json, const char *what) {
        T obj{};
        try {
            iod::stringview str(json.data(), json.size());
            iod::json_decode(obj, str);
        }
        catch (const std::exception& ex) {
            throw DockerError(utils::catstr("decoding ", what, " failed: ", ex.what()),
                              std::current_exception());
        }
        return obj;
    }

    template <typename Func>
    static auto onContainer(const std::string& id, Func func) -> decltype(func()) {
        try {
            return func();
        }
        catch (const RequestError& ex) {
            if (ex.status() == 404) {
                throw ContainerNotFoundError(id, std::current_exception());
            }
            throw;
        }
    }

    template <typename Func>
    static auto onImage(const std::string& image, Func func) -> decltype(func()) {
        try {
            return func();
        }
        catch (const RequestError& ex) {
            if (ex.status() == 404) {
                throw ImageNotFoundError(image, std::current_exception());
            }
            throw;
        }
    }

    Client::Client(const Endpoint &ep, const ClientConfig &config)
        : m_config(config),
          m_executor(ep, config.pool)
    {
        if (!m_config.certPath.empty() && !ep.isSecure()) {
            throw Exception::invalidArguments("a certificate path requires an https endpoint, got '",
                                              ep.uri(), "'");
        }

        if (m_config.apiVersion.empty()) {
            throw Exception::invalidArguments("the docker API version cannot be empty");
        }

        idebug("docker client for %s using API %s", ep.uri().c_str(), m_config.apiVersion.c_str());
    }

    std::string Client::resource(const std::string &path) const {
        return utils::catstr("/", m_config.apiVersion, path);
    }

    std::string Client::authHeader() const {
        if (!m_config.hasAuth) {
            return "null";
        }
        return utils::base64::encode(iod::json_encode(m_config.auth));
    }

    std::unique_ptr<http::BodySource> Client::interruptible(http::Response&& resp) const {
        return std::make_unique<InterruptibleBody>(
                std::make_unique<http::Response>(std::move(resp)), m_cancel);
    }

    std::string Client::fetch(http::Request &&req, PoolClass cls) {
        http::Method method = req.method();
        std::string  uri = m_executor.uri(req.target());
        auto body = interruptible(m_executor.execute(std::move(req), cls, m_cancel));
        try {
            std::string out{};
            char buf[4096];
            size_t nrd;
            while ((nrd = body->read(buf, sizeof(buf))) > 0) {
                out.append(buf, nrd);
            }
            return out;
        }
        catch (const std::exception&) {
            propagate(std::current_exception(), method, uri);
        }
    }

    ProgressStream Client::progress(http::Request &&req) {
        http::Method method = req.method();
        std::string  uri = m_executor.uri(req.target());
        auto resp = m_executor.execute(std::move(req), PoolClass::Bounded, m_cancel);
        return ProgressStream(interruptible(std::move(resp)), method, std::move(uri));
    }

    LogStream Client::stream(http::Request &&req) {
        http::Method method = req.method();
        std::string  uri = m_executor.uri(req.target());
        auto resp = m_executor.execute(std::move(req), PoolClass::Bounded, m_cancel);
        return LogStream(interruptible(std::move(resp)), method, std::move(uri));
    }

    std::string Client::ping() {
        return fetch(http::Request(http::Method::Get, resource("/_ping")));
    }

    Version Client::version() {
        auto json = fetch(http::Request(http::Method::Get, resource("/version")));
        return decode<Version>(json, "version");
    }

    std::string Client::info() {
        return fetch(http::Request(http::Method::Get, resource("/info")));
    }

    std::string Client::inspectContainer(const std::string &id) {
        return onContainer(id, [&] {
            http::Request req(http::Method::Get, resource(utils::catstr("/containers/", id, "/json")));
            return fetch(std::move(req));
        });
    }

    std::string Client::createContainer(const std::string &config, const std::string &name) {
        http::Request req(http::Method::Post, resource("/containers/create"));
        if (!name.empty()) {
            if (!validContainerName(name)) {
                throw Exception::invalidArguments("invalid container name: \"", name, "\"");
            }
            req.arg("name", name);
        }
        req.body(config);

        iinfo("creating container %s", name.empty()? "(unnamed)" : name.c_str());
        try {
            return fetch(std::move(req));
        }
        catch (const RequestError& ex) {
            if (ex.status() == 404) {
                // the daemon names the missing image in the message
                std::string image{ex.message()};
                if (utils::startswith(image, "No such image: ")) {
                    image = image.substr(sizeofcstr("No such image: "));
                }
                while (!image.empty() && isspace((unsigned char) image.back())) {
                    image.pop_back();
                }
                throw ImageNotFoundError(std::move(image), std::current_exception());
            }
            throw;
        }
    }

    void Client::startContainer(const std::string &id) {
        iinfo("starting container %s", id.c_str());
        onContainer(id, [&] {
            http::Request req(http::Method::Post, resource(utils::catstr("/containers/", id, "/start")));
            req.body("{}");
            fetch(std::move(req));
        });
    }

    void Client::stopContainer(const std::string &id, int secs) {
        onContainer(id, [&] {
            http::Request req(http::Method::Post, resource(utils::catstr("/containers/", id, "/stop")));
            req.arg("t", secs);
            // 304 when the container is already stopped
            fetch(std::move(req), PoolClass::Unbounded);
        });
    }

    int Client::waitContainer(const std::string &id) {
        return onContainer(id, [&] {
            http::Request req(http::Method::Post, resource(utils::catstr("/containers/", id, "/wait")));
            auto json = fetch(std::move(req), PoolClass::Unbounded);
            return decode<ContainerExit>(json, "container exit").StatusCode;
        });
    }

    void Client::removeContainer(const std::string &id, bool removeVolumes) {
        onContainer(id, [&] {
            http::Request req(http::Method::Delete, resource(utils::catstr("/containers/", id)));
            req.arg("v", utils::tostr(removeVolumes));
            fetch(std::move(req));
        });
    }

    LogStream Client::logs(const std::string &id, const LogsParams &params) {
        return onContainer(id, [&] {
            http::Request req(http::Method::Get, resource(utils::catstr("/containers/", id, "/logs")));
            if (params.follow)     req.arg("follow", "true");
            if (params.stdOut)     req.arg("stdout", "true");
            if (params.stdErr)     req.arg("stderr", "true");
            if (params.timestamps) req.arg("timestamps", "true");
            req.hdr("Accept", std::string("application/vnd.docker.raw-stream"));
            return stream(std::move(req));
        });
    }

    LogStream Client::attachContainer(const std::string &id, const AttachParams &params) {
        return onContainer(id, [&] {
            http::Request req(http::Method::Post, resource(utils::catstr("/containers/", id, "/attach")));
            if (params.logs)   req.arg("logs", "true");
            if (params.stream) req.arg("stream", "true");
            if (params.stdIn)  req.arg("stdin", "true");
            if (params.stdOut) req.arg("stdout", "true");
            if (params.stdErr) req.arg("stderr", "true");
            req.hdr("Accept", std::string("application/vnd.docker.raw-stream"));
            return stream(std::move(req));
        });
    }

    void Client::pull(const std::string &image) {
        LoggingProgressHandler handler(utils::catstr("pull ", image));
        pull(image, handler);
    }

    void Client::pull(const std::string &image, ProgressHandler &handler) {
        ImageRef ref(image);
        http::Request req(http::Method::Post, resource("/images/create"));
        req.arg("fromImage", ref.image());
        if (!ref.tag().empty()) {
            req.arg("tag", ref.tag());
        }
        req.hdr("X-Registry-Auth", authHeader());

        iinfo("pulling image %s", image.c_str());
        onImage(image, [&] {
            progress(std::move(req)).tail(handler);
        });
    }

    void Client::push(const std::string &image) {
        LoggingProgressHandler handler(utils::catstr("push ", image));
        push(image, handler);
    }

    void Client::push(const std::string &image, ProgressHandler &handler) {
        ImageRef ref(image);
        http::Request req(http::Method::Post, resource(utils::catstr("/images/", ref.image(), "/push")));
        if (!ref.tag().empty()) {
            req.arg("tag", ref.tag());
        }
        // the daemon wants the header even for registries without authentication
        req.hdr("X-Registry-Auth", authHeader());

        iinfo("pushing image %s", image.c_str());
        onImage(image, [&] {
            progress(std::move(req)).tail(handler);
        });
    }

    std::string Client::build(const std::string &archive, const std::string &name) {
        LoggingProgressHandler handler(utils::catstr("build ", name));
        return build(archive, name, handler);
    }

    std::string Client::build(const std::string &archive, const std::string &name, ProgressHandler &handler) {
        http::Request req(http::Method::Post, resource("/build"));
        if (!name.empty()) {
            req.arg("t", name);
        }
        req.file(archive, "application/tar");

        iinfo("building image %s from %s", name.c_str(), archive.c_str());
        return progress(std::move(req)).tail(handler);
    }

    std::string Client::inspectImage(const std::string &image) {
        return onImage(image, [&] {
            http::Request req(http::Method::Get, resource(utils::catstr("/images/", image, "/json")));
            return fetch(std::move(req));
        });
    }

    void Client::close() {
        if (!m_closed) {
            m_closed = true;
            idebug("closing docker client for %s", m_executor.endpoint().uri().c_str());
            m_executor.shutdown();
        }
    }
}
