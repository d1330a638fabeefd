//
// Created by dc on 22/06/17.
//
#define CATCH_CONFIG_RUNNER

#include <csignal>

#include <catch2/catch.hpp>

#include <dockwire/logging.h>

using namespace dockwire;

TEST_CASE("dockwire::version", "[version]") {
    REQUIRE(std::string(version::SWNAME) == "dockwire");
    REQUIRE(version::MAJOR == DOCKWIRE_MAJOR_VERSION);
    REQUIRE(version::MINOR == DOCKWIRE_MINOR_VERSION);
    REQUIRE(version::PATCH == DOCKWIRE_PATCH_VERSION);
}

int main(int argc, const char *argv[])
{
    // the mock daemon closes connections under the client's feet
    signal(SIGPIPE, SIG_IGN);
    log::setup(opt(verbose, 1));

    int result = Catch::Session().run(argc, argv);
    return (result < 0xff ? result: 0xff);
}
