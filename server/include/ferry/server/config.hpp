#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ferry::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};

        std::uint64_t chunk_size{1024 * 1024};
        int compression_level{6};
        std::uint32_t max_parallel_chunks{5};

        std::chrono::seconds session_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds sweep_interval{std::chrono::seconds{300}};
        std::size_t max_sessions{256};
        std::uint64_t max_staged_bytes{2ULL * 1024 * 1024 * 1024};
        std::size_t max_missing_reported{1024};

        std::optional<std::filesystem::path> log_file;
    };

    // Overlays the keys present in a JSON document onto config. Unknown keys are ignored.
    void load_config_file(const std::filesystem::path &path, ServerConfig &config);

    // Throws std::invalid_argument naming the first offending option.
    void validate_config(const ServerConfig &config);

} // namespace ferry::server
