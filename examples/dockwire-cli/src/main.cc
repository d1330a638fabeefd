//
// Created by dc on 18/11/18.
//
#include <csignal>
#include <iostream>

#include <dockwire/docker.h>

using namespace dockwire;

static int usage(const char *prog) {
    fprintf(stderr, "usage: %s ping | logs <container> | pull <image>\n", prog);
    return EXIT_FAILURE;
}

int main(int argc, char *argv[])
{
    signal(SIGPIPE, SIG_IGN);
    log::setup(opt(verbose, 2), opt(name, "dockwire-cli"));

    if (argc < 2) {
        return usage(argv[0]);
    }

    std::string cmd{argv[1]};
    try {
        auto client = docker::Client::fromEnv(opt(readTimeout, 0));
        sinfo("using docker at %s", client->endpoint().uri().c_str());

        if (cmd == "ping" && argc == 2) {
            std::cout << client->ping() << std::endl;
        }
        else if (cmd == "logs" && argc == 3) {
            auto logs = client->logs(argv[2], opt(stdOut, true), opt(stdErr, true));
            logs.attach(std::cout, std::cerr);
        }
        else if (cmd == "pull" && argc == 3) {
            LoggingProgressHandler handler(utils::catstr("pull ", argv[2]));
            client->pull(argv[2], handler);
            sinfo("pulled %s", argv[2]);
        }
        else {
            return usage(argv[0]);
        }
    }
    catch (const Exception& ex) {
        serror("%s failed: %s", cmd.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
