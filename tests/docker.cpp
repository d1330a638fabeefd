//
// Created by dc on 17/11/18.
//
#include <unistd.h>
#include <sstream>

#include <catch2/catch.hpp>

#include <dockwire/docker.h>

#include "daemon.h"

using namespace dockwire;
using namespace dockwire::docker;

namespace {

    struct Recorder : ProgressHandler {
        void progress(const ProgressMessage& msg) override {
            statuses.push_back(msg.status.empty()? msg.stream : msg.status);
        }
        std::vector<std::string> statuses{};
    };

    coroutine void cancelAfter(Cancellation *token, int64_t ms) {
        msleep(mnow() + ms);
        token->cancel();
    }

    test::Reply ok(const std::string& body = "") {
        return test::Reply{test::reply(200, body)};
    }
}

TEST_CASE("docker::ImageRef", "[docker][image]")
{
    ImageRef plain("busybox");
    REQUIRE(plain.image() == "busybox");
    REQUIRE(plain.tag().empty());

    ImageRef tagged("busybox:latest");
    REQUIRE(tagged.image() == "busybox");
    REQUIRE(tagged.tag() == "latest");

    ImageRef registry("registry:5000/busybox");
    REQUIRE(registry.image() == "registry:5000/busybox");
    REQUIRE(registry.tag().empty());

    ImageRef both("registry:5000/dc/busybox:1.0");
    REQUIRE(both.image() == "registry:5000/dc/busybox");
    REQUIRE(both.tag() == "1.0");
}

TEST_CASE("docker::validContainerName", "[docker][names]")
{
    REQUIRE(validContainerName("web"));
    REQUIRE(validContainerName("/web_01-a"));
    REQUIRE_FALSE(validContainerName(""));
    REQUIRE_FALSE(validContainerName("/"));
    REQUIRE_FALSE(validContainerName("web app"));
    REQUIRE_FALSE(validContainerName("web/app"));
    REQUIRE_FALSE(validContainerName("web.app"));
    REQUIRE_FALSE(validContainerName("caf\xc3\xa9"));
}

TEST_CASE("docker::ClientConfig", "[docker][config]")
{
    SECTION("defaults") {
        auto cfg = ClientConfig::make();
        REQUIRE(cfg.apiVersion == "v1.12");
        REQUIRE(cfg.pool.size == 100);
        REQUIRE(cfg.pool.connectTimeout == 5_sec);
        REQUIRE(cfg.pool.readTimeout == 30_sec);
        REQUIRE_FALSE(cfg.hasAuth);
    }

    SECTION("options") {
        AuthConfig auth{};
        auth.username = "dc";
        auto cfg = ClientConfig::make(opt(connectTimeout, 1_sec),
                                      opt(readTimeout, 0),
                                      opt(poolSize, 4),
                                      opt(apiVersion, std::string("v1.24")),
                                      opt(auth, auth));
        REQUIRE(cfg.pool.connectTimeout == 1_sec);
        REQUIRE(cfg.pool.readTimeout == 0);
        REQUIRE(cfg.pool.size == 4);
        REQUIRE(cfg.apiVersion == "v1.24");
        REQUIRE(cfg.hasAuth);
        REQUIRE(cfg.auth.username == "dc");
    }

    SECTION("invalid configurations") {
        REQUIRE_THROWS_AS(Client("unix:///var/run/docker.sock", opt(certPath, std::string("/certs"))),
                          Exception);
        REQUIRE_THROWS_AS(Client("http://localhost:2375", opt(apiVersion, std::string(""))),
                          Exception);
        REQUIRE_THROWS_AS(Client("http://localhost:2375", opt(poolSize, 0)), Exception);
        REQUIRE_THROWS_AS(Client("docker.sock"), Exception);
    }

    SECTION("twice the pool size") {
        Client client("unix:///var/run/docker.sock", opt(poolSize, 5));
        REQUIRE(client.pools().capacity() == 10);
        REQUIRE(client.endpoint().isUnix());
        client.close();
        client.close();
    }
}

TEST_CASE("docker::Client", "[docker][client]")
{
    SECTION("ping and version") {
        test::MockDaemon daemon([](const test::Exchange& ex) {
            if (ex.target == "/v1.12/_ping") {
                return ok("OK");
            }
            return ok(R"({"Version":"1.0.0","ApiVersion":"1.12","Os":"linux","Arch":"amd64",)"
                      R"("KernelVersion":"3.13","GoVersion":"go1.2","GitCommit":"63fe64c"})");
        });

        Client client(daemon.uri());
        REQUIRE(client.ping() == "OK");
        auto v = client.version();
        REQUIRE(v.Version == "1.0.0");
        REQUIRE(v.ApiVersion == "1.12");
        REQUIRE(v.Os == "linux");
        REQUIRE(daemon.connections() == 1);
    }

    SECTION("missing containers") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::reply(404, "No such container: abc")};
        });

        Client client(daemon.uri());
        try {
            client.inspectContainer("abc");
            FAIL("inspecting should have failed");
        }
        catch (const ContainerNotFoundError& ex) {
            REQUIRE(ex.containerId() == "abc");
            REQUIRE(ex.cause() != nullptr);
        }

        REQUIRE_THROWS_AS(client.startContainer("abc"), ContainerNotFoundError);
        REQUIRE_THROWS_AS(client.removeContainer("abc"), ContainerNotFoundError);
        REQUIRE_THROWS_AS(client.logs("abc", opt(stdOut, true)), ContainerNotFoundError);
    }

    SECTION("container lifecycle") {
        test::MockDaemon daemon([](const test::Exchange& ex) {
            if (ex.target == "/v1.12/containers/create?name=web") {
                return test::Reply{test::reply(201, R"({"Id":"e90e34656806","Warnings":[]})")};
            }
            if (ex.target == "/v1.12/containers/e90e/start") {
                return test::Reply{test::reply(204, "")};
            }
            if (ex.target == "/v1.12/containers/e90e/stop?t=10") {
                // already stopped
                return test::Reply{test::reply(304, "")};
            }
            if (ex.target == "/v1.12/containers/e90e/wait") {
                return ok(R"({"StatusCode":3})");
            }
            if (ex.target == "/v1.12/containers/e90e?v=true") {
                return test::Reply{test::reply(204, "")};
            }
            return test::Reply{test::reply(500, "unexpected " + ex.target)};
        });

        Client client(daemon.uri());
        auto created = client.createContainer(R"({"Image":"busybox"})", "web");
        REQUIRE(created.find("e90e34656806") != std::string::npos);
        REQUIRE_THROWS_AS(client.createContainer("{}", "web app"), Exception);

        client.startContainer("e90e");
        client.stopContainer("e90e", 10);
        REQUIRE(client.waitContainer("e90e") == 3);
        client.removeContainer("e90e", true);

        REQUIRE(daemon.exchanges[0].body == R"({"Image":"busybox"})");
        REQUIRE(daemon.exchanges[1].method == "POST");
        REQUIRE(daemon.exchanges[1].body == "{}");
        REQUIRE(daemon.exchanges[4].method == "DELETE");
        // stop and wait block on the daemon and use their own pool
        REQUIRE(client.pools()[PoolClass::Unbounded].idle() == 1);
        REQUIRE(client.pools()[PoolClass::Bounded].idle() == 1);
    }

    SECTION("missing images") {
        test::MockDaemon daemon([](const test::Exchange& ex) {
            if (ex.target == "/v1.12/containers/create") {
                return test::Reply{test::reply(404, "No such image: busybox:nope\n")};
            }
            return test::Reply{test::reply(404, "No such image")};
        });

        Client client(daemon.uri());
        try {
            client.createContainer(R"({"Image":"busybox:nope"})");
            FAIL("creating should have failed");
        }
        catch (const ImageNotFoundError& ex) {
            REQUIRE(ex.image() == "busybox:nope");
        }

        REQUIRE_THROWS_AS(client.inspectImage("busybox:nope"), ImageNotFoundError);
        REQUIRE_THROWS_AS(client.pull("busybox:nope"), ImageNotFoundError);
    }

    SECTION("other failures are request errors") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::reply(500, "server error")};
        });

        Client client(daemon.uri());
        try {
            client.info();
            FAIL("info should have failed");
        }
        catch (const RequestError& ex) {
            REQUIRE(ex.status() == 500);
            REQUIRE(ex.message() == "server error");
            REQUIRE(ex.uri() == "unix://localhost:80/v1.12/info");
        }
    }
}

TEST_CASE("docker::images", "[docker][images]")
{
    SECTION("pull reports progress") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::chunked(200, {
                R"({"status":"Pulling repository busybox"})",
                R"({"status":"Downloading","progressDetail":{"current":10,"total":)",
                R"(20},"id":"a1b2"}{"status":"Download complete","id":"a1b2"})",
                R"({"status":"Status: Downloaded newer image for busybox:latest"})"
            }, "Content-Type: application/json\r\n")};
        });

        Client client(daemon.uri());
        Recorder handler;
        client.pull("busybox:latest", handler);
        REQUIRE(handler.statuses.size() == 4);
        REQUIRE(handler.statuses[1] == "Downloading");
        REQUIRE(handler.statuses[3] == "Status: Downloaded newer image for busybox:latest");

        auto& ex = daemon.exchanges.front();
        REQUIRE(ex.target == "/v1.12/images/create?fromImage=busybox&tag=latest");
        REQUIRE(ex.headers["X-Registry-Auth"] == "null");
        // the body was drained, the connection went back to the pool
        REQUIRE(client.pools()[PoolClass::Bounded].idle() == 1);
    }

    SECTION("pull errors") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::chunked(200, {
                R"({"status":"Pulling repository busybox"})",
                R"({"error":"Error: image busybox:nope not found"})"
            })};
        });

        Client client(daemon.uri());
        REQUIRE_THROWS_AS(client.pull("busybox:nope"), DockerError);
    }

    SECTION("push authenticates") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::chunked(200, {R"({"status":"Pushing tag for rev [a1b2]"})"})};
        });

        AuthConfig auth{};
        auth.username = "dc";
        auth.password = "pass";
        Client client(daemon.uri(), opt(auth, auth));
        client.push("registry:5000/busybox:1.0");

        auto& ex = daemon.exchanges.front();
        REQUIRE(ex.target == "/v1.12/images/registry:5000/busybox/push?tag=1.0");
        auto header = ex.headers["X-Registry-Auth"];
        REQUIRE(header != "null");
        REQUIRE(header == utils::base64::encode(iod::json_encode(auth)));
    }

    SECTION("build returns the image id") {
        char tmpl[] = "/tmp/dockwire-context-XXXXXX";
        int fd = mkstemp(tmpl);
        REQUIRE(fd >= 0);
        std::string context{"FROM busybox\nCMD echo hello\n"};
        REQUIRE(::write(fd, context.data(), context.size()) == (ssize_t) context.size());
        ::close(fd);

        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::chunked(200, {
                R"({"stream":"Step 0 : FROM busybox\n"})",
                R"({"stream":" ---> 4986bf8c1536\n"})",
                R"({"stream":"Step 1 : CMD echo hello\n"})",
                R"({"stream":"Successfully built 7d9495d03763\n"})",
                R"({"stream":"Removing intermediate container 1f2a\n"})"
            })};
        });

        Client client(daemon.uri());
        REQUIRE(client.build(tmpl, "hello") == "7d9495d03763");
        ::unlink(tmpl);

        auto& ex = daemon.exchanges.front();
        REQUIRE(ex.target == "/v1.12/build?t=hello");
        REQUIRE(ex.headers["Content-Type"] == "application/tar");
        REQUIRE(ex.body == context);
    }
}

TEST_CASE("docker::logs", "[docker][logs]")
{
    test::MockDaemon daemon([](const test::Exchange&) {
        return test::Reply{test::reply(200, test::frames({{1, "hello "}, {2, "warning\n"}, {1, "world\n"}}),
                                       "Content-Type: application/vnd.docker.raw-stream\r\n")};
    });

    Client client(daemon.uri());

    SECTION("reading the whole log") {
        auto logs = client.logs("e90e", opt(stdOut, true), opt(stdErr, true));
        REQUIRE(logs.readFully() == "hello warning\nworld\n");

        auto& ex = daemon.exchanges.front();
        REQUIRE(ex.target == "/v1.12/containers/e90e/logs?stdout=true&stderr=true");
        REQUIRE(ex.headers["Accept"] == "application/vnd.docker.raw-stream");
        REQUIRE(client.pools()[PoolClass::Bounded].idle() == 1);
    }

    SECTION("attaching") {
        AttachParams params;
        params.logs   = true;
        params.stdOut = true;
        params.stdErr = true;
        auto stream = client.attachContainer("e90e", params);

        std::stringstream out, err;
        stream.attach(out, err);
        REQUIRE(out.str() == "hello world\n");
        REQUIRE(err.str() == "warning\n");
        REQUIRE(daemon.exchanges.front().target == "/v1.12/containers/e90e/attach?logs=true&stdout=true&stderr=true");
    }
}

TEST_CASE("docker::interrupt", "[docker][cancel]")
{
    test::MockDaemon daemon([](const test::Exchange& ex) {
        if (ex.target.find("/attach") != std::string::npos) {
            // one frame, then the container stays quiet
            return test::Reply{"HTTP/1.1 200 OK\r\n"
                               "Content-Type: application/vnd.docker.raw-stream\r\n\r\n" +
                               test::frames({{1, "hello\n"}})};
        }
        return test::Reply{test::reply(200, R"({"StatusCode":0})"), 300};
    });

    // reads never time out on their own
    Client client(daemon.uri(), opt(readTimeout, 0));
    Cancellation token;
    client.interruptWith(&token);

    SECTION("waiting for a response") {
        token.cancel();
        REQUIRE_THROWS_AS(client.waitContainer("e90e"), InterruptedError);

        client.interruptWith(nullptr);
        REQUIRE(client.waitContainer("e90e") == 0);
    }

    SECTION("reading a quiet stream") {
        auto stream = client.attachContainer("e90e", opt(stream, true), opt(stdOut, true));
        go(cancelAfter(&token, 100));

        std::stringstream out, err;
        int64_t start = mnow();
        try {
            stream.attach(out, err);
            FAIL("attach should have been interrupted");
        }
        catch (const InterruptedError& ex) {
            REQUIRE(ex.Code == errors::Interrupted);
            REQUIRE(std::string(ex.what()) ==
                    "Interrupted: POST unix://localhost:80/v1.12/containers/e90e/attach?stream=true&stdout=true");
        }
        REQUIRE((mnow() - start) < 1000);
        REQUIRE(out.str() == "hello\n");

        // the stream is done with
        LogFrame frame;
        REQUIRE_FALSE(stream.next(frame));
    }
}
