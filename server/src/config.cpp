#include "ferry/server/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "ferry/framing.hpp"

namespace ferry::server
{

    namespace
    {

        template <typename T>
        void assign_if_present(const nlohmann::json &json, const char *key, T &target)
        {
            if (auto it = json.find(key); it != json.end())
            {
                target = it->get<T>();
            }
        }

        void assign_seconds_if_present(const nlohmann::json &json, const char *key, std::chrono::seconds &target)
        {
            if (auto it = json.find(key); it != json.end())
            {
                target = std::chrono::seconds{it->get<std::int64_t>()};
            }
        }

    } // namespace

    void load_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open config file: " + path.string());
        }
        nlohmann::json json;
        in >> json;
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object: " + path.string());
        }

        assign_if_present(json, "address", config.address);
        assign_if_present(json, "port", config.port);
        if (auto it = json.find("root"); it != json.end())
        {
            config.root = std::filesystem::path(it->get<std::string>());
        }
        assign_if_present(json, "worker_threads", config.worker_threads);
        assign_if_present(json, "chunk_size", config.chunk_size);
        assign_if_present(json, "compression_level", config.compression_level);
        assign_if_present(json, "max_parallel_chunks", config.max_parallel_chunks);
        assign_seconds_if_present(json, "session_timeout", config.session_timeout);
        assign_seconds_if_present(json, "sweep_interval", config.sweep_interval);
        assign_if_present(json, "max_sessions", config.max_sessions);
        assign_if_present(json, "max_staged_bytes", config.max_staged_bytes);
        assign_if_present(json, "max_missing_reported", config.max_missing_reported);
        if (auto it = json.find("log_file"); it != json.end())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }
    }

    void validate_config(const ServerConfig &config)
    {
        if (config.port == 0)
        {
            throw std::invalid_argument("port must be set");
        }
        if (config.root.empty())
        {
            throw std::invalid_argument("root must be set");
        }
        if (config.chunk_size == 0)
        {
            throw std::invalid_argument("chunk_size must be greater than zero");
        }
        if (config.chunk_size > ferry::protocol::kMaxBinaryPayload)
        {
            throw std::invalid_argument("chunk_size must be at most " +
                                        std::to_string(ferry::protocol::kMaxBinaryPayload) +
                                        " bytes to fit in one frame");
        }
        if (config.compression_level < 1 || config.compression_level > 9)
        {
            throw std::invalid_argument("compression_level must be between 1 and 9");
        }
        if (config.max_parallel_chunks == 0)
        {
            throw std::invalid_argument("max_parallel_chunks must be greater than zero");
        }
        if (config.session_timeout.count() <= 0)
        {
            throw std::invalid_argument("session_timeout must be positive");
        }
        if (config.sweep_interval.count() <= 0)
        {
            throw std::invalid_argument("sweep_interval must be positive");
        }
        if (config.max_sessions == 0)
        {
            throw std::invalid_argument("max_sessions must be greater than zero");
        }
    }

} // namespace ferry::server
