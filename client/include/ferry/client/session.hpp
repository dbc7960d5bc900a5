#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "ferry/client/config.hpp"
#include "ferry/client/connection.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/protocol.hpp"

namespace ferry::client
{

    // Attempts per chunk before a transfer is abandoned.
    constexpr int kChunkAttempts = 3;

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        int run();

    private:
        using ChunkTask = std::function<void(Connection &, std::uint64_t)>;

        void perform_info(Connection &control, const std::string &remote_path);
        void perform_download(Connection &control, const std::string &remote_path,
                              const std::filesystem::path &local_target);
        void perform_upload(Connection &control, const std::filesystem::path &local_path,
                            const std::optional<std::string> &remote_dir);

        void download_chunk(Connection &connection, const std::string &remote_path,
                            const ferry::protocol::FileTransferInfo &info, bool compress,
                            const std::filesystem::path &part_path, std::uint64_t chunk_id);
        void upload_chunk(Connection &connection, const std::string &session_id,
                          const std::filesystem::path &local_path, std::uint64_t file_size,
                          std::uint64_t chunk_size, bool compressed, std::uint64_t chunk_id);
        void cancel_upload(Connection &control, const std::string &session_id);

        // Runs task for every chunk id in [0, total_chunks) from `workers` connections.
        // The first failure stops the remaining workers and is rethrown.
        void run_parallel(std::uint64_t total_chunks, std::uint32_t workers, const std::string &label,
                          const ChunkTask &task);

        std::uint32_t worker_count(std::uint32_t recommended, std::uint64_t total_chunks) const;

        ClientConfig config_;
        Logger logger_;
    };

} // namespace ferry::client
