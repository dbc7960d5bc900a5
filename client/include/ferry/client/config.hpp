#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::client
{

    enum class ClientCommand
    {
        Info,
        Download,
        Upload
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        ClientCommand command{ClientCommand::Info};
        std::vector<std::string> arguments;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::uint32_t> parallel;
        bool compress{};
        std::optional<std::uint64_t> chunk_size;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace ferry::client
