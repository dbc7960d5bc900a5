#include "ferry/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace ferry::client
{

    namespace
    {

        constexpr auto kUsage =
            "Usage: client <server>:<port> <info|download|upload> <args...> [--parallel <n>] [--compress] "
            "[--chunk-size <bytes>] [--log <file>]";

        ClientCommand parse_command(const std::string &value)
        {
            if (value == "info")
            {
                return ClientCommand::Info;
            }
            if (value == "download")
            {
                return ClientCommand::Download;
            }
            if (value == "upload")
            {
                return ClientCommand::Upload;
            }
            throw std::runtime_error("Unknown command: " + value);
        }

        std::size_t max_arguments(ClientCommand command)
        {
            return command == ClientCommand::Info ? 1 : 2;
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port_string = endpoint.substr(colon_pos + 1);
        const auto port = std::stoi(port_string);
        if (port <= 0 || port > 65535)
        {
            throw std::runtime_error("Port out of range: " + port_string);
        }
        config.port = static_cast<std::uint16_t>(port);

        config.command = parse_command(argv[index++]);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--parallel")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--parallel requires a value");
                }
                const auto value = std::stoul(argv[index++]);
                if (value == 0)
                {
                    throw std::runtime_error("--parallel must be at least 1");
                }
                config.parallel = static_cast<std::uint32_t>(value);
            }
            else if (arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--chunk-size requires a value (bytes)");
                }
                const auto value = std::stoull(argv[index++]);
                if (value == 0)
                {
                    throw std::runtime_error("--chunk-size must be greater than zero");
                }
                config.chunk_size = value;
            }
            else if (arg == "--compress")
            {
                config.compress = true;
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.arguments.push_back(arg);
            }
        }

        if (config.arguments.empty() || config.arguments.size() > max_arguments(config.command))
        {
            throw std::runtime_error(kUsage);
        }

        return config;
    }

} // namespace ferry::client
