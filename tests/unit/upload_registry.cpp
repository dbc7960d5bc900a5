#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "ferry/compression.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/server/upload_registry.hpp"

using namespace ferry;
using namespace ferry::server;

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

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        const auto view = std::as_bytes(std::span(text.data(), text.size()));
        return {view.begin(), view.end()};
    }

    std::string read_text(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    std::filesystem::path make_temp_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        std::filesystem::create_directories(root);
        return root;
    }

    void test_upload_lifecycle()
    {
        const auto root = make_temp_root("ferry_registry_lifecycle");
        UploadRegistry registry;

        const auto id = registry.init("greeting.txt", root, 3, false);
        assert(id.size() == 32);
        assert(registry.session_count() == 1);

        auto progress = registry.put_chunk(id, 1, bytes_of("lo, "), std::nullopt);
        assert(progress.received_chunks == 1);
        assert(progress.total_chunks == 3);
        assert(!progress.is_complete);
        assert((progress.missing_chunks == std::vector<std::uint64_t>{0, 2}));
        assert(progress.missing_count == 2);

        // Finalize before completion leaves the session queryable.
        expect_transfer_error(ErrorCode::Incomplete, [&]
                              { (void)registry.finalize(id); });
        assert(registry.status(id).received_chunks == 1);

        const auto last = bytes_of("world");
        registry.put_chunk(id, 2, last, crypto::digest(last));
        progress = registry.put_chunk(id, 0, bytes_of("Hel"), std::nullopt);
        assert(progress.is_complete);
        assert(progress.missing_chunks.empty());
        assert(progress.missing_count == 0);
        assert(registry.staged_bytes() == 12);

        const auto result = registry.finalize(id);
        assert(result.final_path == root / "greeting.txt");
        assert(result.file_size == 12);
        assert(read_text(result.final_path) == "Hello, world");
        assert(!std::filesystem::exists(root / "greeting.txt.part"));

        assert(registry.session_count() == 0);
        assert(registry.staged_bytes() == 0);
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)registry.status(id); });
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)registry.finalize(id); });

        cleanup_path(root);
    }

    void test_init_validation()
    {
        const auto root = make_temp_root("ferry_registry_init");
        UploadRegistry registry(RegistryLimits{.max_sessions = 2});

        expect_transfer_error(ErrorCode::InvalidArgument, [&]
                              { (void)registry.init("empty.bin", root, 0, false); });
        expect_transfer_error(ErrorCode::InvalidArgument, [&]
                              { (void)registry.init("../escape.bin", root, 1, false); });
        expect_transfer_error(ErrorCode::InvalidArgument, [&]
                              { (void)registry.init("", root, 1, false); });

        const auto first = registry.init("a.bin", root, 1, false);
        const auto second = registry.init("b.bin", root, 1, false);
        assert(first != second);
        expect_transfer_error(ErrorCode::Busy, [&]
                              { (void)registry.init("c.bin", root, 1, false); });

        registry.cancel(first);
        const auto third = registry.init("c.bin", root, 1, false);
        assert(registry.session_count() == 2);
        registry.cancel(second);
        registry.cancel(third);

        cleanup_path(root);
    }

    void test_put_chunk_rejections()
    {
        const auto root = make_temp_root("ferry_registry_rejections");
        UploadRegistry registry;
        const auto id = registry.init("data.bin", root, 2, false);

        expect_transfer_error(ErrorCode::OutOfRange, [&]
                              { (void)registry.put_chunk(id, 2, bytes_of("x"), std::nullopt); });
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)registry.put_chunk("no-such-session", 0, bytes_of("x"), std::nullopt); });

        const auto payload = bytes_of("payload");
        expect_transfer_error(ErrorCode::CorruptData, [&]
                              { (void)registry.put_chunk(id, 0, payload, crypto::digest(bytes_of("tampered"))); });
        assert(registry.status(id).received_chunks == 0);
        assert(registry.staged_bytes() == 0);

        // Resending a chunk replaces it and the count does not change.
        registry.put_chunk(id, 0, payload, crypto::digest(payload));
        const auto progress = registry.put_chunk(id, 0, bytes_of("p2"), std::nullopt);
        assert(progress.received_chunks == 1);
        assert(registry.staged_bytes() == 2);

        registry.cancel(id);
        assert(registry.staged_bytes() == 0);
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)registry.status(id); });
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { registry.cancel(id); });

        cleanup_path(root);
    }

    void test_compressed_chunks()
    {
        const auto root = make_temp_root("ferry_registry_compressed");
        UploadRegistry registry;
        const auto id = registry.init("log.txt", root, 2, true);

        const auto first = bytes_of(std::string(4096, 'a'));
        const auto wire = compression::compress(first);
        // The digest covers the bytes as sent, i.e. the compressed form.
        registry.put_chunk(id, 0, wire, crypto::digest(wire));
        expect_transfer_error(ErrorCode::CorruptData, [&]
                              { (void)registry.put_chunk(id, 0, wire, crypto::digest(first)); });

        expect_transfer_error(ErrorCode::CorruptData, [&]
                              { (void)registry.put_chunk(id, 1, bytes_of("not gzip at all"), std::nullopt); });
        assert(registry.status(id).received_chunks == 1);

        // An empty chunk travels as a gzip stream of nothing.
        registry.put_chunk(id, 1, compression::compress({}), std::nullopt);
        const auto result = registry.finalize(id);
        assert(result.file_size == 4096);
        assert(read_text(result.final_path) == std::string(4096, 'a'));

        cleanup_path(root);
    }

    void test_empty_file_upload()
    {
        const auto root = make_temp_root("ferry_registry_empty");
        UploadRegistry registry;
        const auto id = registry.init("empty.txt", root, 1, false);
        registry.put_chunk(id, 0, {}, crypto::digest({}));
        const auto result = registry.finalize(id);
        assert(result.file_size == 0);
        assert(std::filesystem::exists(root / "empty.txt"));
        assert(std::filesystem::file_size(root / "empty.txt") == 0);
        cleanup_path(root);
    }

    void test_missing_list_truncated()
    {
        const auto root = make_temp_root("ferry_registry_missing");
        UploadRegistry registry(RegistryLimits{.max_missing_reported = 3});
        const auto id = registry.init("big.bin", root, 10, false);
        registry.put_chunk(id, 1, bytes_of("x"), std::nullopt);

        const auto progress = registry.status(id);
        assert((progress.missing_chunks == std::vector<std::uint64_t>{0, 2, 3}));
        assert(progress.missing_count == 9);
        registry.cancel(id);
        cleanup_path(root);
    }

    void test_staging_limit()
    {
        const auto root = make_temp_root("ferry_registry_staging");
        UploadRegistry registry(RegistryLimits{.max_staged_bytes = 8});
        const auto id = registry.init("limit.bin", root, 3, false);

        registry.put_chunk(id, 0, bytes_of("12345"), std::nullopt);
        expect_transfer_error(ErrorCode::Busy, [&]
                              { (void)registry.put_chunk(id, 1, bytes_of("6789"), std::nullopt); });
        assert(registry.status(id).received_chunks == 1);
        assert(registry.staged_bytes() == 5);

        // Shrinking a staged chunk frees room for the next one.
        registry.put_chunk(id, 0, bytes_of("1"), std::nullopt);
        registry.put_chunk(id, 1, bytes_of("6789"), std::nullopt);
        assert(registry.staged_bytes() == 5);
        registry.cancel(id);
        cleanup_path(root);
    }

    void test_compressed_chunk_bounded_by_staging_limit()
    {
        const auto root = make_temp_root("ferry_registry_inflate_limit");
        constexpr std::uint64_t kLimit = 1024 * 1024;
        UploadRegistry registry(RegistryLimits{.max_staged_bytes = kLimit});
        const auto id = registry.init("zeros.bin", root, 2, true);

        // 64 MiB of zeros compress to about 64 KiB on the wire.
        const std::vector<std::byte> zeros(64 * 1024 * 1024);
        const auto bomb = compression::compress(zeros, compression::kMaxLevel);
        assert(bomb.size() < kLimit);

        expect_transfer_error(ErrorCode::Busy, [&]
                              { (void)registry.put_chunk(id, 0, bomb, crypto::digest(bomb)); });
        assert(registry.status(id).received_chunks == 0);
        assert(registry.staged_bytes() == 0);

        // A chunk that inflates to exactly the free room is still accepted.
        const std::vector<std::byte> fits(kLimit);
        registry.put_chunk(id, 0, compression::compress(fits), std::nullopt);
        assert(registry.staged_bytes() == kLimit);
        expect_transfer_error(ErrorCode::Busy, [&]
                              { (void)registry.put_chunk(id, 1, compression::compress(bytes_of("x")), std::nullopt); });

        registry.cancel(id);
        cleanup_path(root);
    }

    void test_finalize_failure_keeps_session()
    {
        const auto root = make_temp_root("ferry_registry_finalize_failure");
        UploadRegistry registry;
        const auto id = registry.init("blocked.txt", root, 1, false);
        registry.put_chunk(id, 0, bytes_of("content"), std::nullopt);

        // A regular file where a directory is needed makes the write fail.
        const auto blocker = root / "blocker";
        {
            std::ofstream out(blocker);
            out << "x";
        }
        expect_transfer_error(ErrorCode::IoError, [&]
                              { (void)registry.finalize(id, blocker / "sub"); });

        const auto progress = registry.status(id);
        assert(progress.is_complete);
        assert(progress.received_chunks == 1);

        const auto target = root / "retry";
        const auto result = registry.finalize(id, target);
        assert(result.final_path == target / "blocked.txt");
        assert(read_text(result.final_path) == "content");

        cleanup_path(root);
    }

    void test_concurrent_chunks()
    {
        const auto root = make_temp_root("ferry_registry_concurrent");
        UploadRegistry registry;
        constexpr std::uint64_t kChunks = 64;
        constexpr int kThreads = 8;
        const auto id = registry.init("parallel.txt", root, kChunks, false);

        auto chunk_text = [](std::uint64_t chunk_id)
        {
            return std::string(1, static_cast<char>('A' + chunk_id % 26)) + std::to_string(chunk_id) + ";";
        };

        std::atomic<std::uint64_t> next{0};
        std::vector<std::thread> workers;
        for (int i = 0; i < kThreads; ++i)
        {
            workers.emplace_back([&]
                                 {
                for (auto chunk_id = next.fetch_add(1); chunk_id < kChunks; chunk_id = next.fetch_add(1))
                {
                    const auto data = bytes_of(chunk_text(chunk_id));
                    // Each chunk is sent twice to exercise idempotent replacement under contention.
                    registry.put_chunk(id, chunk_id, data, crypto::digest(data));
                    registry.put_chunk(id, chunk_id, data, std::nullopt);
                    (void)registry.status(id);
                } });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }

        const auto progress = registry.status(id);
        assert(progress.received_chunks == kChunks);
        assert(progress.is_complete);

        std::string expected;
        for (std::uint64_t chunk_id = 0; chunk_id < kChunks; ++chunk_id)
        {
            expected += chunk_text(chunk_id);
        }
        const auto result = registry.finalize(id);
        assert(read_text(result.final_path) == expected);
        cleanup_path(root);
    }

    void test_retire_race()
    {
        const auto root = make_temp_root("ferry_registry_race");
        for (int round = 0; round < 20; ++round)
        {
            UploadRegistry registry;
            const auto id = registry.init("race.txt", root, 1, false);
            registry.put_chunk(id, 0, bytes_of("r"), std::nullopt);

            std::atomic<int> winners{0};
            std::thread finalizer([&]
                                  {
                try
                {
                    (void)registry.finalize(id);
                    ++winners;
                }
                catch (const TransferError &ex)
                {
                    assert(ex.code() == ErrorCode::NotFound);
                } });
            std::thread canceller([&]
                                  {
                try
                {
                    registry.cancel(id);
                    ++winners;
                }
                catch (const TransferError &ex)
                {
                    assert(ex.code() == ErrorCode::NotFound);
                } });
            finalizer.join();
            canceller.join();

            assert(winners.load() == 1);
            assert(registry.session_count() == 0);
            assert(registry.staged_bytes() == 0);
        }
        cleanup_path(root);
    }

    void test_sweep_expired()
    {
        const auto root = make_temp_root("ferry_registry_sweep");
        UploadRegistry registry;
        const auto stale = registry.init("stale.bin", root, 2, false);
        registry.put_chunk(stale, 0, bytes_of("old"), std::nullopt);
        const auto fresh = registry.init("fresh.bin", root, 2, false);

        const auto now = UploadRegistry::Clock::now();
        assert(registry.sweep_expired(now, std::chrono::seconds(60)) == 0);

        // Touch the fresh session so only the stale one is idle past the timeout.
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        const auto cutoff = UploadRegistry::Clock::now();
        registry.put_chunk(fresh, 0, bytes_of("new"), std::nullopt);

        const auto later = cutoff + std::chrono::seconds(10);
        assert(registry.sweep_expired(later, std::chrono::seconds(10)) == 1);
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)registry.status(stale); });
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)registry.put_chunk(stale, 1, bytes_of("late"), std::nullopt); });
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)registry.finalize(stale, std::nullopt); });
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { registry.cancel(stale); });
        assert(!std::filesystem::exists(root / "stale.bin"));
        assert(registry.status(fresh).received_chunks == 1);
        assert(registry.staged_bytes() == 3);

        registry.cancel(fresh);
        cleanup_path(root);
    }

} // namespace

void run_upload_registry_tests()
{
    test_upload_lifecycle();
    test_init_validation();
    test_put_chunk_rejections();
    test_compressed_chunks();
    test_empty_file_upload();
    test_missing_list_truncated();
    test_staging_limit();
    test_compressed_chunk_bounded_by_staging_limit();
    test_finalize_failure_keeps_session();
    test_concurrent_chunks();
    test_retire_race();
    test_sweep_expired();
}
