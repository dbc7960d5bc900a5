#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "ferry/server/config.hpp"
#include "ferry/server/server.hpp"
#include "ferry/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "Ferry server " << ferry::version() << "\n"
                  << "Usage: " << program_name << " --port <PORT> --root <ROOT> [options]\n"
                  << "  --config <FILE>             JSON file with server settings\n"
                  << "  --address <ADDRESS>         listen address (default 0.0.0.0)\n"
                  << "  --threads <N>               worker threads (default: hardware concurrency)\n"
                  << "  --chunk-size <BYTES>        chunk size advertised to clients\n"
                  << "  --compression-level <1-9>   gzip level for downloads\n"
                  << "  --max-parallel <N>          recommended parallel chunk transfers\n"
                  << "  --session-timeout <SECONDS> idle upload sessions are discarded after this\n"
                  << "  --sweep-interval <SECONDS>  how often idle sessions are checked\n"
                  << "  --max-sessions <N>          open upload sessions allowed at once\n"
                  << "  --max-staged-bytes <BYTES>  chunk bytes held in memory across all sessions\n"
                  << "  --log <FILE>                also write the log to FILE\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::filesystem::path> find_config_path(int argc, char *argv[])
    {
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(argv[i + 1]);
            }
        }
        return std::nullopt;
    }

} // namespace

int main(int argc, char *argv[])
{
    using ferry::server::Server;
    using ferry::server::ServerConfig;

    ServerConfig config;

    try
    {
        // The file is applied first so command line options override it.
        if (auto config_path = find_config_path(argc, argv))
        {
            ferry::server::load_config_file(*config_path, config);
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid config file: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }

        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        try
        {
            if (arg == "--config")
            {
                continue;
            }
            else if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = std::stoull(*value);
            }
            else if (arg == "--compression-level")
            {
                config.compression_level = std::stoi(*value);
            }
            else if (arg == "--max-parallel")
            {
                config.max_parallel_chunks = static_cast<std::uint32_t>(std::stoul(*value));
            }
            else if (arg == "--session-timeout")
            {
                config.session_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--max-sessions")
            {
                config.max_sessions = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--max-staged-bytes")
            {
                config.max_staged_bytes = std::stoull(*value);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
        catch (const std::logic_error &)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << std::endl;
            return EXIT_FAILURE;
        }
    }

    try
    {
        ferry::server::validate_config(config);
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting Ferry server {} on {}:{}", ferry::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
