#include "ferry/server/transfer_service.hpp"

#include <chrono>
#include <fstream>

#include <spdlog/spdlog.h>

#include "ferry/chunker.hpp"
#include "ferry/compression.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/framing.hpp"

namespace ferry::server
{

    namespace
    {

        std::uint64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto system_time = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                              std::chrono::system_clock::now());
            return static_cast<std::uint64_t>(system_time.time_since_epoch().count());
        }

        std::uint64_t regular_file_size(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto status = std::filesystem::status(path, ec);
            if (ec || !std::filesystem::exists(status))
            {
                throw TransferError(ErrorCode::NotFound, "File does not exist: " + path.string());
            }
            if (!std::filesystem::is_regular_file(status))
            {
                throw TransferError(ErrorCode::InvalidArgument, "Not a regular file: " + path.string());
            }
            const auto size = std::filesystem::file_size(path, ec);
            if (ec)
            {
                throw TransferError(ErrorCode::IoError, "Cannot stat " + path.string() + ": " + ec.message());
            }
            return size;
        }

        std::vector<std::byte> read_whole_file(const std::filesystem::path &path, std::uint64_t file_size)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                throw TransferError(ErrorCode::IoError, "Failed to open file for reading: " + path.string());
            }
            std::vector<std::byte> data(static_cast<std::size_t>(file_size));
            file.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
            if (static_cast<std::uint64_t>(file.gcount()) != file_size)
            {
                throw TransferError(ErrorCode::IoError, "Short read on " + path.string());
            }
            return data;
        }

        // Compresses data in place unless that would not make it smaller.
        bool compress_if_smaller(std::vector<std::byte> &data, int level)
        {
            auto packed = compression::compress(data, level);
            if (packed.size() >= data.size())
            {
                return false;
            }
            data = std::move(packed);
            return true;
        }

    } // namespace

    TransferService::TransferService(UploadRegistry &registry, TransferPlanner planner, int compression_level)
        : registry_(registry), planner_(planner), compression_level_(compression_level) {}

    protocol::FileTransferInfo TransferService::info(const std::filesystem::path &path) const
    {
        const auto file_size = regular_file_size(path);
        std::vector<std::byte> sample;
        if (file_size > 0)
        {
            sample = chunker::read_chunk(path, 0, compression::kRatioSampleBytes, file_size);
        }
        const auto filename = path.filename().string();
        const auto plan = planner_.plan(file_size, filename, sample);

        std::error_code ec;
        const auto modified = std::filesystem::last_write_time(path, ec);

        spdlog::info("File info requested: {} ({} bytes, {} chunks)", path.string(), file_size, plan.total_chunks);
        return protocol::FileTransferInfo{
            .filename = filename,
            .file_size = file_size,
            .chunk_size = plan.chunk_size,
            .total_chunks = plan.total_chunks,
            .last_modified = ec ? 0 : to_unix_time(modified),
            .should_compress = plan.should_compress,
            .estimated_compression_ratio = plan.estimated_ratio,
            .max_parallel_chunks = plan.recommended_parallelism,
        };
    }

    DownloadedFile TransferService::download_whole(const std::filesystem::path &path, bool compress) const
    {
        const auto file_size = regular_file_size(path);
        if (file_size > protocol::kMaxBinaryPayload)
        {
            throw TransferError(ErrorCode::Unsupported,
                                "File of " + std::to_string(file_size) + " bytes exceeds the " +
                                    std::to_string(protocol::kMaxBinaryPayload) +
                                    " byte single-response limit; use chunked download");
        }
        DownloadedFile result{
            .filename = path.filename().string(),
            .file_size = file_size,
            .compressed = false,
            .data = read_whole_file(path, file_size),
            .digest = {},
        };
        if (compress && compression::should_compress(result.filename))
        {
            result.compressed = compress_if_smaller(result.data, compression_level_);
        }
        result.digest = crypto::digest(result.data);
        spdlog::info("Download of {} ({} bytes, compressed={})", path.string(), file_size, result.compressed);
        return result;
    }

    DownloadedChunk TransferService::download_chunk(const std::filesystem::path &path, std::uint64_t chunk_id,
                                                    bool compress) const
    {
        const auto file_size = regular_file_size(path);
        const auto chunk_size = planner_.settings().chunk_size;
        DownloadedChunk result{
            .chunk_id = chunk_id,
            .chunk_size = chunk_size,
            .total_chunks = chunker::chunk_count(file_size, chunk_size),
            .compressed = false,
            .data = chunker::read_chunk(path, chunk_id, chunk_size, file_size),
            .digest = {},
        };
        if (compress && compression::should_compress(path.filename().string()))
        {
            result.compressed = compress_if_smaller(result.data, compression_level_);
        }
        result.digest = crypto::digest(result.data);
        spdlog::debug("Served chunk {}/{} of {} ({} bytes, compressed={})", chunk_id, result.total_chunks,
                      path.string(), result.data.size(), result.compressed);
        return result;
    }

    std::string TransferService::init_session(const std::string &filename, std::uint64_t total_chunks,
                                              const std::filesystem::path &destination_dir, bool compressed)
    {
        return registry_.init(filename, destination_dir, total_chunks, compressed);
    }

    UploadProgress TransferService::put_chunk(const std::string &session_id, std::uint64_t chunk_id,
                                              std::span<const std::byte> data, const std::optional<std::string> &digest)
    {
        return registry_.put_chunk(session_id, chunk_id, data, digest);
    }

    UploadProgress TransferService::session_status(const std::string &session_id) const
    {
        return registry_.status(session_id);
    }

    FinalizeResult TransferService::finalize_session(const std::string &session_id,
                                                     const std::optional<std::filesystem::path> &destination_dir)
    {
        return registry_.finalize(session_id, destination_dir);
    }

    void TransferService::cancel_session(const std::string &session_id)
    {
        registry_.cancel(session_id);
    }

} // namespace ferry::server
