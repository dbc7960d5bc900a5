#include "ferry/compression.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>

#include <zlib.h>

#include "ferry/error_codes.hpp"

namespace ferry::compression
{

    namespace
    {
        // 15 window bits plus 16 selects the gzip wrapper.
        constexpr int kGzipWindowBits = 15 + 16;
        constexpr int kMemLevel = 8;
        constexpr std::size_t kBufferSize = 64 * 1024;
        constexpr std::size_t kMaxStep = std::numeric_limits<uInt>::max();

        constexpr std::array<std::string_view, 16> kCompressedExtensions{{
            ".zip", ".gz", ".bz2", ".xz", ".7z", ".rar", ".jpg", ".jpeg",
            ".png", ".gif", ".mp4", ".mp3", ".avi", ".mkv", ".pdf", ".apk",
        }};

        std::string zlib_error_message(int code)
        {
            switch (code)
            {
            case Z_STREAM_ERROR:
                return "stream state inconsistent";
            case Z_DATA_ERROR:
                return "input data corrupted";
            case Z_MEM_ERROR:
                return "out of memory";
            case Z_BUF_ERROR:
                return "buffer error";
            case Z_NEED_DICT:
                return "dictionary required";
            case Z_VERSION_ERROR:
                return "zlib version incompatible";
            default:
                return "zlib error " + std::to_string(code);
            }
        }

        void append(std::vector<std::byte> &output, const std::array<unsigned char, kBufferSize> &buffer,
                    std::size_t count)
        {
            const auto *begin = reinterpret_cast<const std::byte *>(buffer.data());
            output.insert(output.end(), begin, begin + count);
        }

    } // namespace

    bool should_compress(std::string_view filename)
    {
        auto extension = std::filesystem::path(std::string(filename)).extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        return std::find(kCompressedExtensions.begin(), kCompressedExtensions.end(), extension) ==
               kCompressedExtensions.end();
    }

    double estimate_ratio(std::span<const std::byte> sample)
    {
        const auto bounded = sample.first(std::min(sample.size(), kRatioSampleBytes));
        if (bounded.empty())
        {
            return 1.0;
        }
        const auto compressed = compress(bounded, kDefaultLevel);
        const auto ratio = static_cast<double>(compressed.size()) / static_cast<double>(bounded.size());
        return std::min(ratio, 1.0);
    }

    std::vector<std::byte> compress(std::span<const std::byte> data, int level)
    {
        if (level < kMinLevel || level > kMaxLevel)
        {
            throw TransferError(ErrorCode::InvalidArgument,
                                "Compression level must be between 1 and 9, got " + std::to_string(level));
        }

        z_stream zs{};
        zs.zalloc = Z_NULL;
        zs.zfree = Z_NULL;
        zs.opaque = Z_NULL;
        const int init = deflateInit2(&zs, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
        if (init != Z_OK)
        {
            throw TransferError(ErrorCode::InternalError, "deflateInit2 failed: " + zlib_error_message(init));
        }
        std::unique_ptr<z_stream, decltype(&deflateEnd)> guard(&zs, deflateEnd);

        std::vector<std::byte> output;
        output.reserve(deflateBound(&zs, static_cast<uLong>(std::min(data.size(), kMaxStep))));
        std::array<unsigned char, kBufferSize> buffer{};
        std::size_t offset = 0;
        int flush = Z_NO_FLUSH;
        do
        {
            const auto step = std::min(data.size() - offset, kMaxStep);
            zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data() + offset));
            zs.avail_in = static_cast<uInt>(step);
            offset += step;
            flush = offset == data.size() ? Z_FINISH : Z_NO_FLUSH;
            do
            {
                zs.next_out = buffer.data();
                zs.avail_out = static_cast<uInt>(buffer.size());
                const int ret = deflate(&zs, flush);
                if (ret == Z_STREAM_ERROR)
                {
                    throw TransferError(ErrorCode::InternalError, "deflate failed: " + zlib_error_message(ret));
                }
                append(output, buffer, buffer.size() - zs.avail_out);
            } while (zs.avail_out == 0);
        } while (flush != Z_FINISH);

        return output;
    }

    std::vector<std::byte> decompress(std::span<const std::byte> data, std::size_t max_output)
    {
        z_stream zs{};
        zs.zalloc = Z_NULL;
        zs.zfree = Z_NULL;
        zs.opaque = Z_NULL;
        zs.next_in = Z_NULL;
        zs.avail_in = 0;
        const int init = inflateInit2(&zs, kGzipWindowBits);
        if (init != Z_OK)
        {
            throw TransferError(ErrorCode::InternalError, "inflateInit2 failed: " + zlib_error_message(init));
        }
        std::unique_ptr<z_stream, decltype(&inflateEnd)> guard(&zs, inflateEnd);

        std::vector<std::byte> output;
        std::array<unsigned char, kBufferSize> buffer{};
        std::size_t offset = 0;
        int ret = Z_OK;
        while (ret != Z_STREAM_END)
        {
            if (zs.avail_in == 0)
            {
                if (offset == data.size())
                {
                    throw TransferError(ErrorCode::CorruptData, "Compressed data is truncated");
                }
                const auto step = std::min(data.size() - offset, kMaxStep);
                zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data() + offset));
                zs.avail_in = static_cast<uInt>(step);
                offset += step;
            }
            zs.next_out = buffer.data();
            zs.avail_out = static_cast<uInt>(buffer.size());
            ret = inflate(&zs, Z_NO_FLUSH);
            if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR)
            {
                throw TransferError(ErrorCode::CorruptData, "Decompression failed: " + zlib_error_message(ret));
            }
            const auto produced = buffer.size() - zs.avail_out;
            if (produced > max_output - output.size())
            {
                throw TransferError(ErrorCode::Busy, "Decompressed data exceeds the " + std::to_string(max_output) +
                                                         " byte limit");
            }
            append(output, buffer, produced);
        }

        if (zs.avail_in != 0 || offset != data.size())
        {
            throw TransferError(ErrorCode::CorruptData, "Trailing data after compressed stream");
        }
        return output;
    }

} // namespace ferry::compression
