#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ferry/protocol.hpp"
#include "ferry/server/transfer_planner.hpp"
#include "ferry/server/upload_registry.hpp"

namespace ferry::server
{

    struct DownloadedFile
    {
        std::string filename;
        std::uint64_t file_size{};
        bool compressed{};
        std::vector<std::byte> data;
        // Digest of data as returned, i.e. of the compressed form when compressed.
        std::string digest;
    };

    struct DownloadedChunk
    {
        std::uint64_t chunk_id{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        bool compressed{};
        std::vector<std::byte> data;
        std::string digest;
    };

    /**
     * Transport-agnostic entry points for file transfers.
     *
     * Paths passed in must already be validated by the caller. Download
     * operations are stateless: the chunk layout is recomputed from the file's
     * current size on every call. Upload operations delegate to the registry.
     * Compression requested for a file whose format is already compressed is
     * skipped silently and reported through the compressed flag.
     */
    class TransferService
    {
    public:
        TransferService(UploadRegistry &registry, TransferPlanner planner, int compression_level);

        protocol::FileTransferInfo info(const std::filesystem::path &path) const;

        DownloadedFile download_whole(const std::filesystem::path &path, bool compress) const;

        DownloadedChunk download_chunk(const std::filesystem::path &path, std::uint64_t chunk_id, bool compress) const;

        std::string init_session(const std::string &filename, std::uint64_t total_chunks,
                                 const std::filesystem::path &destination_dir, bool compressed);

        UploadProgress put_chunk(const std::string &session_id, std::uint64_t chunk_id, std::span<const std::byte> data,
                                 const std::optional<std::string> &digest);

        UploadProgress session_status(const std::string &session_id) const;

        FinalizeResult finalize_session(const std::string &session_id,
                                        const std::optional<std::filesystem::path> &destination_dir);

        void cancel_session(const std::string &session_id);

        const TransferPlanner &planner() const noexcept { return planner_; }

    private:
        UploadRegistry &registry_;
        TransferPlanner planner_;
        int compression_level_;
    };

} // namespace ferry::server
