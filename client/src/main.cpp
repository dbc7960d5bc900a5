#include <cstdlib>
#include <exception>
#include <iostream>

#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/session.hpp"
#include "ferry/crypto.hpp"
#include "ferry/version.hpp"

int main(int argc, char *argv[])
{
    using ferry::client::ClientSession;
    using ferry::client::Logger;

    ferry::client::ClientConfig config;
    try
    {
        config = ferry::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Ferry client " << ferry::version() << "\n" << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        ferry::crypto::ensure_sodium_init();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    Logger logger(config.log_path);
    ClientSession session(std::move(config), std::move(logger));
    return session.run() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
