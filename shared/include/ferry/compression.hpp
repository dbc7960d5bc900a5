/**
 * Ferry - Byte-stream compression for chunk payloads.
 *
 * Payloads are gzip members produced by zlib, so either side can be swapped
 * for any other gzip implementation.
 */
#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

namespace ferry::compression
{

    constexpr int kDefaultLevel = 6;
    constexpr int kMinLevel = 1;
    constexpr int kMaxLevel = 9;

    // Upper bound on the prefix that estimate_ratio() looks at.
    constexpr std::size_t kRatioSampleBytes = 1024 * 1024;

    // Ratios at or above this are not worth the CPU.
    constexpr double kWorthwhileRatio = 0.9;

    // False for names whose extension marks an already-compressed format.
    bool should_compress(std::string_view filename);

    // compressed_size / sample_size for the bounded prefix of sample, in (0, 1].
    double estimate_ratio(std::span<const std::byte> sample);

    std::vector<std::byte> compress(std::span<const std::byte> data, int level = kDefaultLevel);

    // Throws TransferError(CorruptData) unless data is exactly one valid gzip member.
    // Inflating stops with TransferError(Busy) as soon as the output would exceed
    // max_output bytes, so a small input cannot force a large allocation.
    std::vector<std::byte> decompress(std::span<const std::byte> data,
                                      std::size_t max_output = std::numeric_limits<std::size_t>::max());

} // namespace ferry::compression
