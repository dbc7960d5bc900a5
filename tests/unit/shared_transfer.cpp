#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include "ferry/chunker.hpp"
#include "ferry/compression.hpp"
#include "ferry/error_codes.hpp"

using namespace ferry;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    template <typename Fn>
    void expect_transfer_error(ErrorCode expected, Fn &&fn)
    {
        bool caught = false;
        try
        {
            fn();
        }
        catch (const TransferError &ex)
        {
            assert(ex.code() == expected);
            caught = true;
        }
        assert(caught);
    }

    std::vector<std::byte> repetitive_bytes(std::size_t size)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<std::byte>('a' + (i % 4));
        }
        return data;
    }

    std::vector<std::byte> random_bytes(std::size_t size, std::uint32_t seed)
    {
        std::mt19937 engine(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<std::byte> data(size);
        for (auto &b : data)
        {
            b = static_cast<std::byte>(dist(engine));
        }
        return data;
    }

    void write_file(const std::filesystem::path &path, const std::vector<std::byte> &data)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    std::vector<std::byte> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> data(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i)
        {
            data[i] = static_cast<std::byte>(raw[i]);
        }
        return data;
    }

    void test_compression_roundtrip()
    {
        const auto text = repetitive_bytes(64 * 1024);
        const auto packed = compression::compress(text, compression::kMaxLevel);
        assert(packed.size() < text.size());
        // gzip magic
        assert(packed[0] == std::byte{0x1F});
        assert(packed[1] == std::byte{0x8B});
        assert(compression::decompress(packed) == text);

        const std::vector<std::byte> empty;
        const auto packed_empty = compression::compress(empty);
        assert(!packed_empty.empty());
        assert(compression::decompress(packed_empty).empty());

        const auto noise = random_bytes(32 * 1024, 7);
        assert(compression::decompress(compression::compress(noise, compression::kMinLevel)) == noise);
    }

    void test_compression_rejects_bad_input()
    {
        const auto text = repetitive_bytes(4096);
        expect_transfer_error(ErrorCode::InvalidArgument, [&]
                              { (void)compression::compress(text, 0); });
        expect_transfer_error(ErrorCode::InvalidArgument, [&]
                              { (void)compression::compress(text, 10); });

        expect_transfer_error(ErrorCode::CorruptData, [&]
                              { (void)compression::decompress(text); });

        auto packed = compression::compress(text);
        const std::vector<std::byte> truncated(packed.begin(), packed.begin() + static_cast<std::ptrdiff_t>(packed.size() / 2));
        expect_transfer_error(ErrorCode::CorruptData, [&]
                              { (void)compression::decompress(truncated); });

        // The output cap is checked while inflating.
        assert(compression::decompress(packed, text.size()) == text);
        expect_transfer_error(ErrorCode::Busy, [&]
                              { (void)compression::decompress(packed, text.size() - 1); });
        assert(compression::decompress(compression::compress({}), 0).empty());

        packed.push_back(std::byte{0x00});
        expect_transfer_error(ErrorCode::CorruptData, [&]
                              { (void)compression::decompress(packed); });
    }

    void test_should_compress()
    {
        assert(compression::should_compress("notes.txt"));
        assert(compression::should_compress("Makefile"));
        assert(compression::should_compress("archive.tar"));
        assert(!compression::should_compress("photo.jpg"));
        assert(!compression::should_compress("PHOTO.JPEG"));
        assert(!compression::should_compress("backup.tar.gz"));
        assert(!compression::should_compress("movie.MKV"));
        assert(!compression::should_compress("app.apk"));
    }

    void test_estimate_ratio()
    {
        assert(compression::estimate_ratio({}) == 1.0);

        const auto text_ratio = compression::estimate_ratio(repetitive_bytes(256 * 1024));
        assert(text_ratio > 0.0);
        assert(text_ratio < compression::kWorthwhileRatio);

        const auto noise_ratio = compression::estimate_ratio(random_bytes(256 * 1024, 11));
        assert(noise_ratio <= 1.0);
        assert(noise_ratio >= compression::kWorthwhileRatio);
    }

    void test_chunk_layout()
    {
        constexpr std::uint64_t kChunk = 1024 * 1024;
        assert(chunker::chunk_count(0, kChunk) == 0);
        assert(chunker::chunk_count(1, kChunk) == 1);
        assert(chunker::chunk_count(kChunk, kChunk) == 1);
        assert(chunker::chunk_count(5 * kChunk + 1, kChunk) == 6);

        const auto last = chunker::chunk_range(5, kChunk, 5 * kChunk + 1);
        assert(last.offset == 5 * kChunk);
        assert(last.length == 1);

        expect_transfer_error(ErrorCode::OutOfRange, []
                              { (void)chunker::chunk_range(6, kChunk, 5 * kChunk + 1); });
        expect_transfer_error(ErrorCode::OutOfRange, []
                              { (void)chunker::chunk_range(0, kChunk, 0); });
        expect_transfer_error(ErrorCode::InvalidArgument, []
                              { (void)chunker::chunk_count(10, 0); });
    }

    void test_read_and_reassemble()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_chunker_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);

        constexpr std::uint64_t kChunk = 1000;
        const auto source = temp_root / "source.bin";
        const auto original = random_bytes(3500, 3);
        write_file(source, original);

        const auto count = chunker::chunk_count(original.size(), kChunk);
        assert(count == 4);

        // Chunks written out of order still reassemble to the original bytes.
        const auto target = temp_root / "target.bin";
        for (const std::uint64_t chunk_id : {3u, 1u, 0u, 2u})
        {
            const auto chunk = chunker::read_chunk(source, chunk_id, kChunk, original.size());
            assert(chunk.size() == (chunk_id == 3 ? 500u : 1000u));
            chunker::write_chunk_at(target, chunk_id, kChunk, chunk);
        }
        assert(read_file(target) == original);

        expect_transfer_error(ErrorCode::OutOfRange, [&]
                              { (void)chunker::read_chunk(source, 4, kChunk, original.size()); });
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)chunker::read_chunk(temp_root / "missing.bin", 0, kChunk, 10); });
        // The caller's size is stale: the file is shorter than claimed.
        expect_transfer_error(ErrorCode::IoError, [&]
                              { (void)chunker::read_chunk(source, 3, kChunk, 4000); });

        cleanup_path(temp_root);
    }

} // namespace

void run_shared_transfer_tests()
{
    test_compression_roundtrip();
    test_compression_rejects_bad_input();
    test_should_compress();
    test_estimate_ratio();
    test_chunk_layout();
    test_read_and_reassemble();
}
