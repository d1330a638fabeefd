//
// Created by dc on 17/11/18.
//
#include <catch2/catch.hpp>

#include <dockwire/executor.h>
#include <dockwire/progress.h>

#include "daemon.h"

using namespace dockwire;

namespace {

    coroutine void cancelAfter(Cancellation *token, int64_t ms) {
        msleep(mnow() + ms);
        token->cancel();
    }

    PoolConfig mkconfig(int64_t readTimeout = 2000) {
        PoolConfig config{};
        config.size = 2;
        config.connectTimeout = 500;
        config.readTimeout = readTimeout;
        return config;
    }
}

TEST_CASE("executor::execute", "[executor]")
{
    SECTION("keep-alive connections are reused") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::reply(200, "OK", "Content-Type: text/plain\r\n")};
        });

        Executor executor(daemon.endpoint(), mkconfig());
        for (int i = 0; i < 3; i++) {
            auto resp = executor.execute(http::Method::Get, "/v1.12/_ping", PoolClass::Bounded);
            REQUIRE(resp.status() == 200);
            REQUIRE(resp.hdr("content-type") == "text/plain");
            REQUIRE(resp.readAll() == "OK");
            REQUIRE(resp.exhausted());
        }

        REQUIRE(daemon.connections() == 1);
        REQUIRE(executor.pools()[PoolClass::Bounded].idle() == 1);
        REQUIRE(executor.pools()[PoolClass::Bounded].leased() == 0);

        REQUIRE(daemon.exchanges.size() == 3);
        auto& ex = daemon.exchanges.front();
        REQUIRE(ex.method == "GET");
        REQUIRE(ex.target == "/v1.12/_ping");
        REQUIRE(ex.headers["Host"] == "localhost");
        REQUIRE(ex.headers["User-Agent"] == "dockwire/" DOCKWIRE_VERSION_STRING);
    }

    SECTION("request bodies and query arguments") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::reply(201, R"({"Id":"e90e34656806"})")};
        });

        Executor executor(daemon.endpoint(), mkconfig());
        http::Request req(http::Method::Post, "/v1.12/containers/create");
        req.arg("name", "my app");
        req.body(R"({"Image":"busybox"})");
        auto resp = executor.execute(std::move(req), PoolClass::Bounded);
        REQUIRE(resp.status() == 201);
        REQUIRE(resp.readAll() == R"({"Id":"e90e34656806"})");

        auto& ex = daemon.exchanges.front();
        REQUIRE(ex.method == "POST");
        REQUIRE(ex.target == "/v1.12/containers/create?name=my%20app");
        REQUIRE(ex.headers["Content-Type"] == "application/json");
        REQUIRE(ex.body == R"({"Image":"busybox"})");
    }

    SECTION("bodies of unknown length end with the connection") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{"HTTP/1.1 200 OK\r\n\r\nuntil the end", 0, true};
        });

        Executor executor(daemon.endpoint(), mkconfig());
        auto resp = executor.execute(http::Method::Get, "/v1.12/info", PoolClass::Bounded);
        REQUIRE(resp.readAll() == "until the end");
        REQUIRE(executor.pools()[PoolClass::Bounded].idle() == 0);
    }

    SECTION("chunked bodies") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::chunked(200, {"Hello ", "chunked ", "world"})};
        });

        Executor executor(daemon.endpoint(), mkconfig());
        auto resp = executor.execute(http::Method::Get, "/v1.12/info", PoolClass::Bounded);
        std::string body{};
        char buf[4];
        size_t nrd;
        while ((nrd = resp.read(buf, sizeof(buf))) > 0) {
            body.append(buf, nrd);
        }
        REQUIRE(body == "Hello chunked world");
        REQUIRE(executor.pools()[PoolClass::Bounded].idle() == 1);
    }

    SECTION("connections closed by the daemon are replaced") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::reply(200, "OK"), 0, true};
        });

        Executor executor(daemon.endpoint(), mkconfig());
        REQUIRE(executor.execute(http::Method::Get, "/v1.12/_ping", PoolClass::Bounded).readAll() == "OK");
        // let the close reach the client side
        msleep(mnow() + 50);
        REQUIRE(executor.execute(http::Method::Get, "/v1.12/_ping", PoolClass::Bounded).readAll() == "OK");
        REQUIRE(daemon.connections() == 2);
    }
}

TEST_CASE("executor::errors", "[executor][errors]")
{
    SECTION("error statuses are request errors") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::reply(404, "no such container: abc")};
        });

        Executor executor(daemon.endpoint(), mkconfig());
        try {
            executor.execute(http::Method::Get, "/v1.12/containers/abc/json", PoolClass::Bounded);
            FAIL("request should have failed");
        }
        catch (const RequestError& ex) {
            REQUIRE(ex.status() == 404);
            REQUIRE(ex.method() == http::Method::Get);
            REQUIRE(ex.uri() == "unix://localhost:80/v1.12/containers/abc/json");
            REQUIRE(ex.message() == "no such container: abc");
        }

        // the error body was drained, the connection is reusable
        REQUIRE(executor.pools()[PoolClass::Bounded].idle() == 1);
        REQUIRE_THROWS_AS(
                executor.execute(http::Method::Get, "/v1.12/containers/abc/json", PoolClass::Bounded),
                RequestError);
        REQUIRE(daemon.connections() == 1);
    }

    SECTION("slow responses time out") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::reply(200, "OK"), 500};
        });

        Executor executor(daemon.endpoint(), mkconfig(100));
        try {
            executor.execute(http::Method::Get, "/v1.12/_ping", PoolClass::Bounded);
            FAIL("request should have timed out");
        }
        catch (const TimeoutError& ex) {
            REQUIRE(ex.uri() == "unix://localhost:80/v1.12/_ping");
            REQUIRE(ex.cause() != nullptr);
        }

        // the timed out connection is not reused
        REQUIRE(executor.pools()[PoolClass::Bounded].idle() == 0);
        REQUIRE(executor.pools()[PoolClass::Bounded].leased() == 0);
    }

    SECTION("error bodies that stall keep the error status") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{"HTTP/1.1 500 Internal Server Error\r\nContent-Length: 100\r\n\r\nboom"};
        });

        Executor executor(daemon.endpoint(), mkconfig(100));
        try {
            executor.execute(http::Method::Post, "/v1.12/containers/abc/start", PoolClass::Bounded);
            FAIL("request should have failed");
        }
        catch (const TimeoutError&) {
            FAIL("a stalled error body must not hide the status");
        }
        catch (const RequestError& ex) {
            REQUIRE(ex.status() == 500);
            REQUIRE(ex.message() == "boom");
        }

        REQUIRE(executor.pools()[PoolClass::Bounded].idle() == 0);
        REQUIRE(executor.pools()[PoolClass::Bounded].leased() == 0);
    }

    SECTION("unreachable daemons") {
        Executor executor(Endpoint::parse("unix:///tmp/dockwire-missing/docker.sock"), mkconfig());
        REQUIRE_THROWS_AS(executor.execute(http::Method::Get, "/v1.12/_ping", PoolClass::Bounded),
                          DockerError);
    }

    SECTION("shut down executors") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{test::reply(200, "OK")};
        });
        Executor executor(daemon.endpoint(), mkconfig());
        executor.shutdown();
        REQUIRE_THROWS_AS(executor.execute(http::Method::Get, "/v1.12/_ping", PoolClass::Bounded),
                          DockerError);
    }
}

TEST_CASE("executor::cancellation", "[executor][cancel]")
{
    test::MockDaemon daemon([](const test::Exchange&) {
        return test::Reply{test::reply(200, "OK"), 300};
    });
    Executor executor(daemon.endpoint(), mkconfig());

    SECTION("cancelling wakes the waiting caller") {
        Cancellation token;
        go(cancelAfter(&token, 50));
        int64_t start = mnow();
        REQUIRE_THROWS_AS(
                executor.execute(http::Method::Post, "/v1.12/containers/abc/wait", PoolClass::Unbounded,
                                 strview{}, &token),
                InterruptedError);
        REQUIRE((mnow() - start) < 250);
        REQUIRE(token.cancelled());

        // the abandoned request finishes and gives its connection back
        msleep(mnow() + 400);
        REQUIRE(executor.pools()[PoolClass::Unbounded].leased() == 0);
    }

    SECTION("cancelled tokens fail right away") {
        Cancellation token;
        token.cancel();
        token.cancel();
        REQUIRE_THROWS_AS(
                executor.execute(http::Method::Get, "/v1.12/_ping", PoolClass::Bounded, strview{}, &token),
                InterruptedError);
        REQUIRE(daemon.exchanges.empty());
    }

    SECTION("uncancelled tokens do not interfere") {
        Cancellation token;
        auto resp = executor.execute(http::Method::Get, "/v1.12/_ping", PoolClass::Bounded, strview{}, &token);
        REQUIRE(resp.readAll() == "OK");
    }
}

TEST_CASE("executor::streaming", "[executor][stream]")
{
    SECTION("events of an open ended body arrive as they are sent") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{"HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n\r\n"
                               "{\"status\":\"a\"}\n{\"status\":\"b\"}\n"};
        });

        Executor executor(daemon.endpoint(), mkconfig(1000));
        int64_t start = mnow();
        auto resp = executor.execute(http::Method::Post, "/v1.12/images/create", PoolClass::Unbounded);
        ProgressStream stream(std::make_unique<http::Response>(std::move(resp)),
                              http::Method::Post, "unix://localhost:80/v1.12/images/create");

        REQUIRE(stream.hasNext());
        REQUIRE(stream.next().status == "a");
        REQUIRE(stream.hasNext());
        REQUIRE(stream.next().status == "b");
        // neither event waited for the read timeout
        REQUIRE((mnow() - start) < 500);
        stream.close();
    }

    SECTION("a body that goes quiet keeps the bytes it sent") {
        test::MockDaemon daemon([](const test::Exchange&) {
            return test::Reply{"HTTP/1.1 200 OK\r\n\r\npartial"};
        });

        Executor executor(daemon.endpoint(), mkconfig(100));
        auto resp = executor.execute(http::Method::Get, "/v1.12/events", PoolClass::Unbounded);
        char buf[64];
        REQUIRE(resp.read(buf, sizeof(buf)) == 7);
        REQUIRE(std::string(buf, 7) == "partial");
        REQUIRE_THROWS_AS(resp.read(buf, sizeof(buf)), ReadTimeout);
    }
}
