#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "ferry/compression.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/framing.hpp"
#include "ferry/protocol.hpp"
#include "ferry/server/config.hpp"
#include "ferry/server/expiry_sweeper.hpp"
#include "ferry/server/filesystem.hpp"
#include "ferry/server/transfer_planner.hpp"
#include "ferry/server/transfer_service.hpp"
#include "ferry/server/upload_registry.hpp"
#include "session_common.hpp"

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

    void write_text(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::vector<std::byte> random_bytes(std::size_t size)
    {
        std::mt19937 engine(42);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<std::byte> data(size);
        for (auto &b : data)
        {
            b = static_cast<std::byte>(dist(engine));
        }
        return data;
    }

    void test_config_file_overlay()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_config_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);
        const auto config_path = temp_root / "server.json";
        write_text(config_path, nlohmann::json{
                                    {"port", 9100},
                                    {"root", "/srv/ferry"},
                                    {"chunk_size", 65536},
                                    {"session_timeout", 120},
                                    {"unknown_key", true},
                                }
                                    .dump());

        ServerConfig config;
        load_config_file(config_path, config);
        assert(config.port == 9100);
        assert(config.root == std::filesystem::path("/srv/ferry"));
        assert(config.chunk_size == 65536);
        assert(config.session_timeout == std::chrono::seconds(120));
        // Untouched keys keep their defaults.
        assert(config.compression_level == 6);
        assert(config.max_parallel_chunks == 5);
        assert(config.sweep_interval == std::chrono::seconds(300));
        validate_config(config);

        write_text(config_path, R"({"port": "not a number"})");
        bool caught = false;
        try
        {
            ServerConfig broken;
            load_config_file(config_path, broken);
        }
        catch (const nlohmann::json::exception &)
        {
            caught = true;
        }
        assert(caught);

        cleanup_path(temp_root);
    }

    void test_config_validation()
    {
        ServerConfig config;
        config.port = 9000;
        config.root = "/tmp";
        validate_config(config);

        auto expect_invalid = [](ServerConfig candidate)
        {
            bool caught = false;
            try
            {
                validate_config(candidate);
            }
            catch (const std::invalid_argument &)
            {
                caught = true;
            }
            assert(caught);
        };

        auto bad_level = config;
        bad_level.compression_level = 0;
        expect_invalid(bad_level);
        bad_level.compression_level = 10;
        expect_invalid(bad_level);

        auto bad_chunk = config;
        bad_chunk.chunk_size = 0;
        expect_invalid(bad_chunk);

        auto largest_chunk = config;
        largest_chunk.chunk_size = protocol::kMaxBinaryPayload;
        validate_config(largest_chunk);
        largest_chunk.chunk_size = protocol::kMaxBinaryPayload + 1;
        expect_invalid(largest_chunk);

        auto bad_parallel = config;
        bad_parallel.max_parallel_chunks = 0;
        expect_invalid(bad_parallel);

        auto bad_timeout = config;
        bad_timeout.session_timeout = std::chrono::seconds(0);
        expect_invalid(bad_timeout);

        auto no_root = config;
        no_root.root.clear();
        expect_invalid(no_root);
    }

    void test_filesystem_paths()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_fs_test";
        cleanup_path(temp_root);
        Filesystem fs(temp_root);
        std::filesystem::create_directories(fs.root() / "docs");
        write_text(fs.root() / "docs" / "file.txt", "hello");

        assert(fs.resolve("docs/file.txt") == fs.root() / "docs" / "file.txt");
        assert(fs.resolve("/docs/file.txt") == fs.root() / "docs" / "file.txt");
        assert(fs.resolve_for_new_entry("inbox/new.txt") == fs.root() / "inbox" / "new.txt");
        assert(fs.relative_to_root(fs.root() / "docs" / "file.txt") == "docs/file.txt");
        assert(fs.relative_to_root(fs.root()) == ".");

        auto expect_code = [&](const std::string &requested, ErrorCode expected)
        {
            bool caught = false;
            try
            {
                (void)fs.resolve(requested);
            }
            catch (const FilesystemError &ex)
            {
                assert(ex.code() == expected);
                caught = true;
            }
            assert(caught);
        };
        expect_code("../forbidden", ErrorCode::PermissionDenied);
        expect_code("docs/../../etc/passwd", ErrorCode::PermissionDenied);
        expect_code("docs/missing.txt", ErrorCode::NotFound);

        cleanup_path(temp_root);
    }

    void test_transfer_planner()
    {
        expect_transfer_error(ErrorCode::InvalidArgument, []
                              { TransferPlanner planner(PlannerSettings{.chunk_size = 0}); });

        const TransferPlanner planner(PlannerSettings{.chunk_size = 1024, .max_parallel_chunks = 5});
        const std::string text(8192, 'z');
        const auto text_bytes = std::as_bytes(std::span(text.data(), text.size()));

        const auto text_plan = planner.plan(10 * 1024, "notes.txt", text_bytes);
        assert(text_plan.chunk_size == 1024);
        assert(text_plan.total_chunks == 10);
        assert(text_plan.should_compress);
        assert(text_plan.estimated_ratio < compression::kWorthwhileRatio);
        assert(text_plan.recommended_parallelism == 5);

        const auto image_plan = planner.plan(2 * 1024, "photo.png", text_bytes);
        assert(!image_plan.should_compress);
        assert(image_plan.estimated_ratio == 1.0);
        assert(image_plan.recommended_parallelism == 2);

        const auto noise = random_bytes(8192);
        const auto noise_plan = planner.plan(noise.size(), "noise.bin", noise);
        assert(!noise_plan.should_compress);

        const auto empty_plan = planner.plan(0, "empty.txt", {});
        assert(empty_plan.total_chunks == 0);
        assert(!empty_plan.should_compress);
        assert(empty_plan.recommended_parallelism == 1);
    }

    void test_transfer_service_downloads()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_service_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);

        std::string text;
        for (int i = 0; i < 500; ++i)
        {
            text += "line " + std::to_string(i) + " of the transfer log\n";
        }
        const auto text_path = temp_root / "transfer.log";
        write_text(text_path, text);
        const auto image_path = temp_root / "picture.jpg";
        write_text(image_path, text);

        UploadRegistry registry;
        TransferService service(registry, TransferPlanner(PlannerSettings{.chunk_size = 4096, .max_parallel_chunks = 3}),
                                compression::kDefaultLevel);

        const auto info = service.info(text_path);
        assert(info.filename == "transfer.log");
        assert(info.file_size == text.size());
        assert(info.chunk_size == 4096);
        assert(info.total_chunks == (text.size() + 4095) / 4096);
        assert(info.should_compress);
        assert(info.max_parallel_chunks == 3);
        assert(info.last_modified > 0);

        std::string reassembled;
        for (std::uint64_t chunk_id = 0; chunk_id < info.total_chunks; ++chunk_id)
        {
            const auto chunk = service.download_chunk(text_path, chunk_id, true);
            assert(chunk.compressed);
            assert(chunk.total_chunks == info.total_chunks);
            assert(crypto::verify(chunk.data, chunk.digest));
            const auto plain = compression::decompress(chunk.data);
            reassembled.append(reinterpret_cast<const char *>(plain.data()), plain.size());
        }
        assert(reassembled == text);

        const auto image_chunk = service.download_chunk(image_path, 0, true);
        assert(!image_chunk.compressed);
        assert(image_chunk.data.size() == 4096);
        assert(!service.info(image_path).should_compress);

        const auto whole = service.download_whole(text_path, false);
        assert(!whole.compressed);
        assert(whole.file_size == text.size());
        assert(whole.data.size() == text.size());
        assert(whole.digest == crypto::digest(whole.data));

        expect_transfer_error(ErrorCode::OutOfRange, [&]
                              { (void)service.download_chunk(text_path, info.total_chunks, false); });
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)service.info(temp_root / "absent.txt"); });
        expect_transfer_error(ErrorCode::InvalidArgument, [&]
                              { (void)service.download_whole(temp_root, false); });

        cleanup_path(temp_root);
    }

    void test_download_size_limits()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_service_limit_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);

        // Sparse, so the test does not write the bytes out.
        const auto big_path = temp_root / "big.log";
        write_text(big_path, "");
        std::filesystem::resize_file(big_path, protocol::kMaxBinaryPayload + 1);

        UploadRegistry registry;
        TransferService service(registry, TransferPlanner(PlannerSettings{.chunk_size = 4096, .max_parallel_chunks = 3}),
                                compression::kDefaultLevel);
        expect_transfer_error(ErrorCode::Unsupported, [&]
                              { (void)service.download_whole(big_path, false); });
        expect_transfer_error(ErrorCode::Unsupported, [&]
                              { (void)service.download_whole(big_path, true); });

        // The chunked path still serves the same file.
        const auto last = service.info(big_path).total_chunks - 1;
        const auto tail = service.download_chunk(big_path, last, false);
        assert(tail.data.size() == (protocol::kMaxBinaryPayload + 1) % 4096);

        // Incompressible data is sent raw even when compression was asked for.
        const auto noise_path = temp_root / "noise.txt";
        const auto noise = random_bytes(8192);
        {
            std::ofstream out(noise_path, std::ios::binary);
            out.write(reinterpret_cast<const char *>(noise.data()), static_cast<std::streamsize>(noise.size()));
        }
        const auto whole = service.download_whole(noise_path, true);
        assert(!whole.compressed);
        assert(whole.data == noise);
        const auto chunk = service.download_chunk(noise_path, 1, true);
        assert(!chunk.compressed);
        assert(chunk.data.size() == 4096);

        cleanup_path(temp_root);
    }

    void test_response_frame_fallback()
    {
        const auto small = session_common::make_ok_response(nlohmann::json{{"pong", true}}, std::string("r1"));
        const auto frame = session_common::encode_response_frame(small);
        const auto decoded = protocol::try_decode_frame(frame);
        assert(decoded.has_value());
        assert(decoded->message.get<protocol::ResponseEnvelope>().kind == protocol::ResponseKind::Ok);

        const auto huge = session_common::make_ok_response(
            nlohmann::json{{"data", std::string(protocol::kMaxFramePayload, 'A')}}, std::string("r2"));
        const auto fallback_frame = session_common::encode_response_frame(huge);
        assert(fallback_frame.size() < 4096);
        const auto fallback = protocol::try_decode_frame(fallback_frame);
        assert(fallback.has_value());
        const auto envelope = fallback->message.get<protocol::ResponseEnvelope>();
        assert(envelope.kind == protocol::ResponseKind::Error);
        assert(envelope.error == ErrorCode::Unsupported);
        assert(envelope.request_id == std::optional<std::string>("r2"));
    }

    void test_transfer_service_uploads()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_service_upload_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);

        UploadRegistry registry;
        TransferService service(registry, TransferPlanner(PlannerSettings{}), compression::kDefaultLevel);

        const auto id = service.init_session("copy.txt", 2, temp_root, true);
        const std::string first = "first half ";
        const std::string second = "second half";
        const auto first_wire = compression::compress(std::as_bytes(std::span(first.data(), first.size())));
        const auto second_wire = compression::compress(std::as_bytes(std::span(second.data(), second.size())));

        service.put_chunk(id, 1, second_wire, crypto::digest(second_wire));
        assert(service.session_status(id).missing_chunks == std::vector<std::uint64_t>{0});
        service.put_chunk(id, 0, first_wire, std::nullopt);

        const auto result = service.finalize_session(id, std::nullopt);
        assert(result.file_size == first.size() + second.size());
        std::ifstream in(result.final_path, std::ios::binary);
        const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content == first + second);

        const auto abandoned = service.init_session("abandoned.txt", 4, temp_root, false);
        service.cancel_session(abandoned);
        expect_transfer_error(ErrorCode::NotFound, [&]
                              { (void)service.session_status(abandoned); });

        cleanup_path(temp_root);
    }

    void test_expiry_sweeper_run_once()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_sweeper_test";
        UploadRegistry registry;
        asio::io_context io_context;

        const auto id = registry.init("idle.bin", temp_root, 1, false);
        ExpirySweeper patient(io_context, registry, std::chrono::seconds(300), std::chrono::seconds(3600));
        assert(patient.run_once() == 0);
        assert(registry.status(id).total_chunks == 1);

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ExpirySweeper eager(io_context, registry, std::chrono::seconds(300), std::chrono::seconds(0));
        assert(eager.run_once() == 1);
        assert(registry.session_count() == 0);
    }

    void test_expiry_sweeper_timer()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_sweeper_timer_test";
        UploadRegistry registry;
        asio::io_context io_context;
        ExpirySweeper sweeper(io_context, registry, std::chrono::milliseconds(10), std::chrono::seconds(0));

        (void)registry.init("idle.bin", temp_root, 1, false);
        sweeper.start();
        assert(sweeper.running());
        std::thread runner([&]
                           { io_context.run(); });

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (registry.session_count() > 0 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        assert(registry.session_count() == 0);

        sweeper.stop();
        assert(!sweeper.running());
        // With the timer cancelled the io_context runs out of work.
        runner.join();

        // A session opened after stop() is never swept.
        (void)registry.init("late.bin", temp_root, 1, false);
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        assert(registry.session_count() == 1);
    }

    void test_expiry_sweeper_stop_under_load()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "ferry_sweeper_stop_test";
        UploadRegistry registry;
        asio::io_context io_context;
        auto guard = asio::make_work_guard(io_context);
        ExpirySweeper sweeper(io_context, registry, std::chrono::milliseconds(1), std::chrono::seconds(0));

        std::vector<std::thread> runners;
        for (int i = 0; i < 4; ++i)
        {
            runners.emplace_back([&]
                                 { io_context.run(); });
        }
        sweeper.start();
        for (int i = 0; i < 200; ++i)
        {
            (void)registry.init("busy.bin", temp_root, 1, false);
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }

        sweeper.stop();
        // Once stop() has returned nothing removes sessions, even with handlers still queued.
        const auto remaining = registry.session_count();
        (void)registry.init("after_stop.bin", temp_root, 1, false);
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        assert(registry.session_count() == remaining + 1);

        guard.reset();
        io_context.stop();
        for (auto &runner : runners)
        {
            runner.join();
        }
    }

} // namespace

void run_server_component_tests()
{
    test_config_file_overlay();
    test_config_validation();
    test_filesystem_paths();
    test_transfer_planner();
    test_transfer_service_downloads();
    test_download_size_limits();
    test_response_frame_fallback();
    test_transfer_service_uploads();
    test_expiry_sweeper_run_once();
    test_expiry_sweeper_timer();
    test_expiry_sweeper_stop_under_load();
}
