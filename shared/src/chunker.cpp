#include "ferry/chunker.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <string>

#include "ferry/error_codes.hpp"

namespace ferry::chunker
{

    namespace
    {

        void require_chunk_size(std::uint64_t chunk_size)
        {
            if (chunk_size == 0)
            {
                throw TransferError(ErrorCode::InvalidArgument, "Chunk size must be greater than zero");
            }
        }

    } // namespace

    std::uint64_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size)
    {
        require_chunk_size(chunk_size);
        return file_size / chunk_size + (file_size % chunk_size == 0 ? 0 : 1);
    }

    ChunkRange chunk_range(std::uint64_t chunk_id, std::uint64_t chunk_size, std::uint64_t file_size)
    {
        const auto total = chunk_count(file_size, chunk_size);
        if (chunk_id >= total)
        {
            throw TransferError(ErrorCode::OutOfRange, "Chunk " + std::to_string(chunk_id) + " is outside [0, " +
                                                           std::to_string(total) + ")");
        }
        const auto offset = chunk_id * chunk_size;
        return ChunkRange{
            .offset = offset,
            .length = std::min(chunk_size, file_size - offset),
        };
    }

    std::vector<std::byte> read_chunk(const std::filesystem::path &path, std::uint64_t chunk_id,
                                      std::uint64_t chunk_size, std::uint64_t file_size)
    {
        const auto range = chunk_range(chunk_id, chunk_size, file_size);
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
            {
                throw TransferError(ErrorCode::NotFound, "File does not exist: " + path.string());
            }
            throw TransferError(ErrorCode::IoError, "Failed to open file for reading: " + path.string());
        }
        file.seekg(static_cast<std::streamoff>(range.offset));

        std::vector<std::byte> buffer(static_cast<std::size_t>(range.length));
        file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (static_cast<std::uint64_t>(file.gcount()) != range.length)
        {
            throw TransferError(ErrorCode::IoError, "Short read on " + path.string() + " at chunk " +
                                                        std::to_string(chunk_id));
        }
        return buffer;
    }

    void write_chunk_at(const std::filesystem::path &path, std::uint64_t chunk_id, std::uint64_t chunk_size,
                        std::span<const std::byte> data)
    {
        require_chunk_size(chunk_size);
        if (chunk_id > std::numeric_limits<std::uint64_t>::max() / chunk_size)
        {
            throw TransferError(ErrorCode::OutOfRange, "Chunk offset overflows");
        }

        std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
        if (!file.is_open())
        {
            file.open(path, std::ios::binary | std::ios::out | std::ios::trunc);
        }
        if (!file.is_open())
        {
            throw TransferError(ErrorCode::IoError, "Failed to open file for writing: " + path.string());
        }
        file.seekp(static_cast<std::streamoff>(chunk_id * chunk_size));
        file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file)
        {
            throw TransferError(ErrorCode::IoError, "Failed to write chunk " + std::to_string(chunk_id) + " to " +
                                                        path.string());
        }
    }

} // namespace ferry::chunker
