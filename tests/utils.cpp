//
// Created by dc on 10/13/17.
//
#include <catch2/catch.hpp>

#include <dockwire/utils.h>

using namespace dockwire;

TEST_CASE("utils::base64", "[utils][base64]")
{
    SECTION("padding") {
        REQUIRE(utils::base64::encode("") == "");
        REQUIRE(utils::base64::encode("f") == "Zg==");
        REQUIRE(utils::base64::encode("fo") == "Zm8=");
        REQUIRE(utils::base64::encode("foo") == "Zm9v");
        REQUIRE(utils::base64::encode("foobar") == "Zm9vYmFy");
    }

    SECTION("registry authentication document") {
        std::string json{R"({"username":"dc","password":"pass"})"};
        REQUIRE(utils::base64::encode(json) ==
                "eyJ1c2VybmFtZSI6ImRjIiwicGFzc3dvcmQiOiJwYXNzIn0=");
    }

    SECTION("appending to a buffer") {
        OBuffer ob{};
        ob << "auth=";
        utils::base64::encode(ob, (const uint8_t *) "hello", 5);
        REQUIRE(std::string(ob) == "auth=aGVsbG8=");
    }
}

TEST_CASE("utils::urlencode", "[utils][urlencode]")
{
    REQUIRE(utils::urlencode("busybox") == "busybox");
    REQUIRE(utils::urlencode("registry:5000/busybox") == "registry%3A5000%2Fbusybox");
    REQUIRE(utils::urlencode("a b&c=d") == "a%20b%26c%3Dd");
    // unreserved characters are kept
    REQUIRE(utils::urlencode("v1.12_rc-1~") == "v1.12_rc-1~");
    // bytes outside ASCII and embedded NULs are escaped
    REQUIRE(utils::urlencode("caf\xc3\xa9") == "caf%C3%A9");
    REQUIRE(utils::urlencode(std::string("a\0b", 3)) == "a%00b");
}

TEST_CASE("utils::catstr", "[utils][catstr]")
{
    REQUIRE(utils::catstr("/", "v1.12", "/containers/", 42, "/json") == "/v1.12/containers/42/json");
    REQUIRE(utils::tostr(true) == "true");
    REQUIRE(utils::tostr(false) == "false");
    REQUIRE(utils::tostr(10) == "10");
    REQUIRE(utils::startswith("unix:///var/run", "unix://"));
    REQUIRE_FALSE(utils::startswith("unix", "unix://"));
}

TEST_CASE("utils::OBuffer", "[utils][buffer]")
{
    SECTION("consuming from the front") {
        OBuffer ob{16};
        ob << "hello world";
        REQUIRE(ob.size() == 11);
        ob.consume(6);
        REQUIRE(std::string(ob) == "world");
        ob.consume(5);
        REQUIRE(ob.empty());
    }

    SECTION("growing past the initial size") {
        OBuffer ob{4};
        std::string big(1000, 'x');
        ob.append(big);
        REQUIRE(ob.size() == 1000);
        REQUIRE(strview(ob) == big);
    }

    SECTION("seeking outside the buffer") {
        OBuffer ob{4};
        ob << "abc";
        ob.seek(-1);
        REQUIRE(ob.size() == 2);
        try {
            ob.seek(1024);
            FAIL("seek should have failed");
        }
        catch (const Exception& ex) {
            REQUIRE(ex.Code == Exception::OutOfRange);
        }
        REQUIRE(ob.size() == 2);
    }

    SECTION("case insensitive header maps") {
        CaseMap<std::string> headers{};
        headers["Content-Length"] = "10";
        REQUIRE(headers.find("content-length") != headers.end());
        REQUIRE(headers["CONTENT-LENGTH"] == "10");
    }
}
