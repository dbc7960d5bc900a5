#include "ferry/client/session.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "ferry/error_codes.hpp"

namespace ferry::client
{

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)), logger_(std::move(logger)) {}

    int ClientSession::run()
    {
        try
        {
            Connection control(config_.host, config_.port, logger_);
            const auto &args = config_.arguments;
            switch (config_.command)
            {
            case ClientCommand::Info:
                perform_info(control, args[0]);
                break;
            case ClientCommand::Download:
            {
                std::filesystem::path local_target =
                    args.size() == 2 ? std::filesystem::path(args[1]) : std::filesystem::path(args[0]).filename();
                if (local_target.empty())
                {
                    local_target = std::filesystem::path("downloaded_file");
                }
                perform_download(control, args[0], local_target);
                break;
            }
            case ClientCommand::Upload:
                perform_upload(control, std::filesystem::path(args[0]),
                               args.size() == 2 ? std::optional<std::string>(args[1]) : std::nullopt);
                break;
            }
        }
        catch (const ferry::TransferError &ex)
        {
            std::cerr << "ERROR: " << ferry::to_string(ex.code()) << std::endl;
            std::cerr << ex.what() << std::endl;
            logger_.error("session", ferry::to_string(ex.code()), ": ", ex.what());
            return 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.error("session", "fatal: ", ex.what());
            return 1;
        }
        logger_.flush();
        return 0;
    }

    void ClientSession::perform_info(Connection &control, const std::string &remote_path)
    {
        const auto info = control.call(ferry::protocol::Command::FileInfo, ferry::protocol::FileInfoRequest{remote_path})
                              .get<ferry::protocol::FileTransferInfo>();
        std::cout << "Filename:            " << info.filename << "\n"
                  << "Size:                " << info.file_size << " bytes\n"
                  << "Chunk size:          " << info.chunk_size << " bytes\n"
                  << "Chunks:              " << info.total_chunks << "\n"
                  << "Last modified:       " << info.last_modified << "\n"
                  << "Compress:            " << (info.should_compress ? "yes" : "no") << "\n"
                  << "Estimated ratio:     " << info.estimated_compression_ratio << "\n"
                  << "Parallel chunks:     " << info.max_parallel_chunks << std::endl;
    }

    void ClientSession::run_parallel(std::uint64_t total_chunks, std::uint32_t workers, const std::string &label,
                                     const ChunkTask &task)
    {
        std::atomic<std::uint64_t> next_chunk{0};
        std::atomic<std::uint64_t> completed{0};
        std::atomic<bool> failed{false};
        std::mutex mutex;
        std::exception_ptr first_error;

        auto worker = [&]
        {
            try
            {
                Connection connection(config_.host, config_.port, logger_);
                while (!failed.load())
                {
                    const auto chunk_id = next_chunk.fetch_add(1);
                    if (chunk_id >= total_chunks)
                    {
                        break;
                    }
                    task(connection, chunk_id);
                    const auto done = completed.fetch_add(1) + 1;
                    std::lock_guard lock(mutex);
                    std::cout << "\r" << label << ' ' << done << " / " << total_chunks << " chunks" << std::flush;
                }
            }
            catch (const std::exception &)
            {
                std::lock_guard lock(mutex);
                if (!first_error)
                {
                    first_error = std::current_exception();
                }
                failed.store(true);
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::uint32_t i = 0; i < workers; ++i)
        {
            threads.emplace_back(worker);
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        std::cout << std::endl;

        if (first_error)
        {
            std::rethrow_exception(first_error);
        }
    }

    std::uint32_t ClientSession::worker_count(std::uint32_t recommended, std::uint64_t total_chunks) const
    {
        const auto requested = config_.parallel.value_or(std::max<std::uint32_t>(recommended, 1));
        return static_cast<std::uint32_t>(std::min<std::uint64_t>(requested, std::max<std::uint64_t>(total_chunks, 1)));
    }

} // namespace ferry::client
