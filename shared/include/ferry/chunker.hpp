/**
 * Ferry - Mapping between files and fixed-size chunk index ranges.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace ferry::chunker
{

    constexpr std::uint64_t kDefaultChunkSize = 1024 * 1024;

    struct ChunkRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    // ceil(file_size / chunk_size); zero for an empty file.
    std::uint64_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size);

    // Byte range of chunk_id, OutOfRange when chunk_id >= chunk_count().
    ChunkRange chunk_range(std::uint64_t chunk_id, std::uint64_t chunk_size, std::uint64_t file_size);

    std::vector<std::byte> read_chunk(const std::filesystem::path &path, std::uint64_t chunk_id,
                                      std::uint64_t chunk_size, std::uint64_t file_size);

    // Writes data at chunk_id * chunk_size, creating the file when absent and
    // growing it as needed. Existing bytes outside the range are preserved.
    void write_chunk_at(const std::filesystem::path &path, std::uint64_t chunk_id, std::uint64_t chunk_size,
                        std::span<const std::byte> data);

} // namespace ferry::chunker
