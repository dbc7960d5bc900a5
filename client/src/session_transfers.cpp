#include "ferry/client/session.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <span>
#include <vector>

#include "ferry/chunker.hpp"
#include "ferry/compression.hpp"
#include "ferry/crypto.hpp"
#include "ferry/encoding/base64.hpp"
#include "ferry/error_codes.hpp"

namespace ferry::client
{

    namespace
    {

        // Errors a resend of the same chunk can cure.
        bool is_retryable(ferry::ErrorCode code)
        {
            return code == ferry::ErrorCode::CorruptData || code == ferry::ErrorCode::Busy;
        }

        std::filesystem::path part_path_for(const std::filesystem::path &target)
        {
            auto part = target;
            part += ".part";
            return part;
        }

        void create_sized_file(const std::filesystem::path &path, std::uint64_t size)
        {
            {
                std::ofstream out(path, std::ios::binary | std::ios::trunc);
                if (!out.is_open())
                {
                    throw ferry::TransferError(ferry::ErrorCode::IoError, "Could not create " + path.string());
                }
            }
            std::filesystem::resize_file(path, size);
        }

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

    } // namespace

    void ClientSession::perform_download(Connection &control, const std::string &remote_path,
                                         const std::filesystem::path &local_target_input)
    {
        auto local_target = local_target_input;
        if (std::filesystem::is_directory(local_target))
        {
            local_target /= std::filesystem::path(remote_path).filename();
        }

        const auto info = control.call(ferry::protocol::Command::FileInfo, ferry::protocol::FileInfoRequest{remote_path})
                              .get<ferry::protocol::FileTransferInfo>();
        const bool compress = config_.compress || info.should_compress;
        logger_.info("download", remote_path, " size=", info.file_size, " chunks=", info.total_chunks,
                    " compress=", compress);

        const auto part_path = part_path_for(local_target);
        create_sized_file(part_path, info.file_size);

        try
        {
            const auto workers = worker_count(info.max_parallel_chunks, info.total_chunks);
            run_parallel(info.total_chunks, workers, "Downloaded",
                         [&](Connection &connection, std::uint64_t chunk_id)
                         { download_chunk(connection, remote_path, info, compress, part_path, chunk_id); });
            std::filesystem::rename(part_path, local_target);
        }
        catch (const std::exception &)
        {
            remove_quietly(part_path);
            throw;
        }

        std::cout << "OK: " << local_target.string() << " (" << info.file_size << " bytes)" << std::endl;
        logger_.info("download", "completed ", local_target.string());
    }

    void ClientSession::download_chunk(Connection &connection, const std::string &remote_path,
                                       const ferry::protocol::FileTransferInfo &info, bool compress,
                                       const std::filesystem::path &part_path, std::uint64_t chunk_id)
    {
        const ferry::protocol::DownloadChunkRequest request{
            .path = remote_path,
            .chunk_id = chunk_id,
            .compress = compress,
        };

        for (int attempt = 1;; ++attempt)
        {
            try
            {
                const auto response = connection.call(ferry::protocol::Command::DownloadChunk, request)
                                          .get<ferry::protocol::DownloadChunkResponse>();
                if (response.total_chunks != info.total_chunks)
                {
                    throw ferry::TransferError(ferry::ErrorCode::Incomplete, "Remote file changed during download");
                }
                auto wire = ferry::encoding::decode_base64(response.data_base64);
                if (!wire)
                {
                    throw ferry::TransferError(ferry::ErrorCode::CorruptData, "Chunk payload is not valid base64");
                }
                if (!ferry::crypto::verify(*wire, response.digest))
                {
                    throw ferry::TransferError(ferry::ErrorCode::CorruptData,
                                               "Digest mismatch for chunk " + std::to_string(chunk_id));
                }
                const auto data = response.compressed ? ferry::compression::decompress(*wire) : std::move(*wire);
                ferry::chunker::write_chunk_at(part_path, chunk_id, info.chunk_size, data);
                return;
            }
            catch (const ferry::TransferError &ex)
            {
                if (!is_retryable(ex.code()) || attempt >= kChunkAttempts)
                {
                    throw;
                }
                logger_.warn("download", "chunk ", chunk_id, " attempt ", attempt, " failed: ", ex.what());
            }
        }
    }

    void ClientSession::perform_upload(Connection &control, const std::filesystem::path &local_path_input,
                                       const std::optional<std::string> &remote_dir)
    {
        const auto local_path = std::filesystem::absolute(local_path_input);
        if (!std::filesystem::is_regular_file(local_path))
        {
            throw ferry::TransferError(ferry::ErrorCode::NotFound, "Local file does not exist: " + local_path.string());
        }

        const auto filename = local_path.filename().string();
        const auto file_size = std::filesystem::file_size(local_path);
        const auto chunk_size = config_.chunk_size.value_or(ferry::chunker::kDefaultChunkSize);
        // An empty file still travels as one empty chunk.
        const auto total_chunks = std::max<std::uint64_t>(ferry::chunker::chunk_count(file_size, chunk_size), 1);
        const bool compressed = config_.compress && ferry::compression::should_compress(filename);

        const auto init = control.call(ferry::protocol::Command::UploadInit,
                                       ferry::protocol::UploadInitRequest{
                                           .filename = filename,
                                           .total_chunks = total_chunks,
                                           .destination = remote_dir,
                                           .compressed = compressed,
                                       })
                              .get<ferry::protocol::UploadInitResponse>();
        logger_.info("upload", filename, " session=", init.session_id, " chunks=", total_chunks,
                    " compressed=", compressed);

        try
        {
            const auto workers = worker_count(init.max_parallel_chunks, total_chunks);
            run_parallel(total_chunks, workers, "Uploaded",
                         [&](Connection &connection, std::uint64_t chunk_id)
                         {
                             upload_chunk(connection, init.session_id, local_path, file_size, chunk_size, compressed,
                                          chunk_id);
                         });

            const auto progress = control.call(ferry::protocol::Command::UploadStatus,
                                               ferry::protocol::SessionRequest{init.session_id})
                                      .get<ferry::protocol::UploadProgressResponse>();
            if (!progress.is_complete)
            {
                throw ferry::TransferError(ferry::ErrorCode::Incomplete,
                                           std::to_string(progress.missing_count) + " chunks missing after upload");
            }

            const auto result = control.call(ferry::protocol::Command::UploadFinalize,
                                             ferry::protocol::UploadFinalizeRequest{.session_id = init.session_id})
                                    .get<ferry::protocol::UploadFinalizeResponse>();
            std::cout << "OK: " << result.path << " (" << result.file_size << " bytes)" << std::endl;
            logger_.info("upload", "finalized ", result.path);
        }
        catch (const std::exception &)
        {
            cancel_upload(control, init.session_id);
            throw;
        }
    }

    void ClientSession::upload_chunk(Connection &connection, const std::string &session_id,
                                     const std::filesystem::path &local_path, std::uint64_t file_size,
                                     std::uint64_t chunk_size, bool compressed, std::uint64_t chunk_id)
    {
        std::vector<std::byte> data;
        if (file_size > 0)
        {
            data = ferry::chunker::read_chunk(local_path, chunk_id, chunk_size, file_size);
        }
        const auto wire = compressed ? ferry::compression::compress(data) : std::move(data);
        const ferry::protocol::UploadChunkRequest request{
            .session_id = session_id,
            .chunk_id = chunk_id,
            .data_base64 = ferry::encoding::encode_base64(wire),
            .digest = ferry::crypto::digest(wire),
        };

        for (int attempt = 1;; ++attempt)
        {
            try
            {
                connection.call(ferry::protocol::Command::UploadChunk, request);
                return;
            }
            catch (const ferry::TransferError &ex)
            {
                if (!is_retryable(ex.code()) || attempt >= kChunkAttempts)
                {
                    throw;
                }
                logger_.warn("upload", "chunk ", chunk_id, " attempt ", attempt, " failed: ", ex.what());
            }
        }
    }

    void ClientSession::cancel_upload(Connection &control, const std::string &session_id)
    {
        try
        {
            const auto response =
                control.rpc(ferry::protocol::Command::UploadCancel, ferry::protocol::SessionRequest{session_id});
            logger_.info("upload", "cancel session=", session_id,
                        response.kind == ferry::protocol::ResponseKind::Ok ? " ok" : " refused: " + response.message);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("upload", "cancel session=", session_id, " failed: ", ex.what());
        }
    }

} // namespace ferry::client
