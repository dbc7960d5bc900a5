#include "ferry/server/upload_registry.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <map>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/compression.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"

namespace ferry::server
{

    namespace
    {
        constexpr std::size_t kSessionIdBytes = 16;
        constexpr auto kPartSuffix = ".part";

        bool is_plain_filename(std::string_view name)
        {
            if (name.empty() || name == "." || name == "..")
            {
                return false;
            }
            return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
        }

        void discard_part_file(const std::filesystem::path &path) noexcept
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        TransferError unknown_session(const std::string &session_id)
        {
            return TransferError(ErrorCode::NotFound, "Unknown upload session: " + session_id);
        }

    } // namespace

    struct UploadRegistry::UploadSession
    {
        UploadSession(std::string session_id, std::string target_filename, std::filesystem::path destination,
                      std::uint64_t chunk_total, bool chunks_compressed)
            : id(std::move(session_id)),
              filename(std::move(target_filename)),
              destination_dir(std::move(destination)),
              total_chunks(chunk_total),
              compressed(chunks_compressed),
              created_at(Clock::now()),
              last_activity(created_at) {}

        const std::string id;
        const std::string filename;
        const std::filesystem::path destination_dir;
        const std::uint64_t total_chunks;
        const bool compressed;
        const Clock::time_point created_at;

        std::mutex mutex;
        Clock::time_point last_activity;
        std::map<std::uint64_t, std::vector<std::byte>> chunks;
        std::uint64_t staged_bytes{};
        bool retired{};
    };

    UploadRegistry::UploadRegistry(RegistryLimits limits) : limits_(limits) {}

    std::string UploadRegistry::init(const std::string &filename, const std::filesystem::path &destination_dir,
                                     std::uint64_t total_chunks, bool compressed)
    {
        if (total_chunks == 0)
        {
            throw TransferError(ErrorCode::InvalidArgument, "total_chunks must be at least 1");
        }
        if (!is_plain_filename(filename))
        {
            throw TransferError(ErrorCode::InvalidArgument, "Invalid upload filename: " + filename);
        }

        auto session_id = crypto::random_token(kSessionIdBytes);
        {
            std::lock_guard lock(mutex_);
            if (sessions_.size() >= limits_.max_sessions)
            {
                spdlog::warn("Refusing upload of {}: {} sessions already open", filename, sessions_.size());
                throw TransferError(ErrorCode::Busy, "Too many open upload sessions");
            }
            sessions_.emplace(session_id, std::make_shared<UploadSession>(session_id, filename, destination_dir,
                                                                          total_chunks, compressed));
        }

        spdlog::info("Upload session {} initialized for {} ({} chunks, compressed={})", session_id, filename,
                     total_chunks, compressed);
        return session_id;
    }

    UploadProgress UploadRegistry::put_chunk(const std::string &session_id, std::uint64_t chunk_id,
                                             std::span<const std::byte> data,
                                             const std::optional<std::string> &expected_digest)
    {
        const auto session = find_session(session_id);
        if (chunk_id >= session->total_chunks)
        {
            throw TransferError(ErrorCode::OutOfRange, "Chunk " + std::to_string(chunk_id) + " is outside [0, " +
                                                           std::to_string(session->total_chunks) + ")");
        }

        if (expected_digest && !crypto::verify(data, *expected_digest))
        {
            spdlog::warn("Session {}: digest mismatch on chunk {}", session_id, chunk_id);
            throw TransferError(ErrorCode::CorruptData, "Chunk " + std::to_string(chunk_id) + " digest mismatch");
        }

        std::vector<std::byte> staged;
        if (session->compressed)
        {
            try
            {
                // Inflate no further than the staging room free right now.
                staged = compression::decompress(data, staging_headroom());
            }
            catch (const TransferError &ex)
            {
                spdlog::warn("Session {}: chunk {} rejected: {}", session_id, chunk_id, ex.what());
                throw;
            }
        }
        else
        {
            staged.assign(data.begin(), data.end());
        }

        std::lock_guard lock(session->mutex);
        if (session->retired)
        {
            throw unknown_session(session_id);
        }

        const auto existing = session->chunks.find(chunk_id);
        const auto previous = existing == session->chunks.end() ? std::uint64_t{0}
                                                                     : static_cast<std::uint64_t>(existing->second.size());
        const auto incoming = static_cast<std::uint64_t>(staged.size());
        if (incoming > previous)
        {
            reserve_staged_bytes(incoming - previous);
        }
        else
        {
            release_staged_bytes(previous - incoming);
        }
        session->chunks.insert_or_assign(chunk_id, std::move(staged));
        session->staged_bytes = session->staged_bytes - previous + incoming;
        session->last_activity = Clock::now();

        spdlog::debug("Session {}: staged chunk {} ({} bytes), {}/{} received", session_id, chunk_id, incoming,
                      session->chunks.size(), session->total_chunks);
        return progress_locked(*session);
    }

    UploadProgress UploadRegistry::status(const std::string &session_id) const
    {
        const auto session = find_session(session_id);
        std::lock_guard lock(session->mutex);
        if (session->retired)
        {
            throw unknown_session(session_id);
        }
        return progress_locked(*session);
    }

    FinalizeResult UploadRegistry::finalize(const std::string &session_id,
                                            const std::optional<std::filesystem::path> &destination_dir)
    {
        const auto session = find_session(session_id);
        std::unique_lock lock(session->mutex);
        if (session->retired)
        {
            throw unknown_session(session_id);
        }
        if (session->chunks.size() < session->total_chunks)
        {
            const auto missing = session->total_chunks - session->chunks.size();
            throw TransferError(ErrorCode::Incomplete, "Upload incomplete: " + std::to_string(missing) +
                                                           " of " + std::to_string(session->total_chunks) +
                                                           " chunks missing");
        }
        session->last_activity = Clock::now();

        const auto destination = destination_dir.value_or(session->destination_dir);
        const auto final_path = destination / session->filename;
        auto part_path = final_path;
        part_path += kPartSuffix;

        std::uint64_t written = 0;
        try
        {
            std::filesystem::create_directories(destination);
            std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw TransferError(ErrorCode::IoError, "Failed to open " + part_path.string() + " for writing");
            }
            // std::map iterates in ascending chunk id order.
            for (const auto &[chunk_id, bytes] : session->chunks)
            {
                out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
                written += bytes.size();
            }
            out.close();
            if (!out)
            {
                throw TransferError(ErrorCode::IoError, "Failed to write " + part_path.string());
            }
            std::filesystem::rename(part_path, final_path);
        }
        catch (const TransferError &ex)
        {
            discard_part_file(part_path);
            spdlog::error("Session {}: finalize into {} failed: {}", session_id, final_path.string(), ex.what());
            throw;
        }
        catch (const std::exception &ex)
        {
            discard_part_file(part_path);
            spdlog::error("Session {}: finalize into {} failed: {}", session_id, final_path.string(), ex.what());
            throw TransferError(ErrorCode::IoError, ex.what());
        }

        retire_locked(*session);
        lock.unlock();
        {
            std::lock_guard registry_lock(mutex_);
            sessions_.erase(session_id);
        }

        spdlog::info("Upload session {} finalized: {} ({} bytes)", session_id, final_path.string(), written);
        return FinalizeResult{.final_path = final_path, .file_size = written};
    }

    void UploadRegistry::cancel(const std::string &session_id)
    {
        std::shared_ptr<UploadSession> session;
        {
            std::lock_guard lock(mutex_);
            auto it = sessions_.find(session_id);
            if (it == sessions_.end())
            {
                throw unknown_session(session_id);
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }

        std::lock_guard lock(session->mutex);
        if (session->retired)
        {
            throw unknown_session(session_id);
        }
        const auto received = session->chunks.size();
        retire_locked(*session);
        spdlog::info("Upload session {} cancelled ({} of {} chunks received)", session_id, received,
                     session->total_chunks);
    }

    std::size_t UploadRegistry::sweep_expired(Clock::time_point now, std::chrono::seconds timeout)
    {
        std::size_t removed = 0;
        std::lock_guard lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            auto &session = *it->second;
            // A session whose lock is held is being written or finalized, so it is not idle.
            std::unique_lock session_lock(session.mutex, std::try_to_lock);
            if (!session_lock.owns_lock() || session.retired || now - session.last_activity <= timeout)
            {
                ++it;
                continue;
            }
            spdlog::info("Upload session {} expired ({} of {} chunks received)", session.id, session.chunks.size(),
                         session.total_chunks);
            retire_locked(session);
            session_lock.unlock();
            it = sessions_.erase(it);
            ++removed;
        }
        return removed;
    }

    std::size_t UploadRegistry::session_count() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::uint64_t UploadRegistry::staged_bytes() const noexcept
    {
        return staged_bytes_.load();
    }

    std::shared_ptr<UploadRegistry::UploadSession> UploadRegistry::find_session(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            throw unknown_session(session_id);
        }
        return it->second;
    }

    UploadProgress UploadRegistry::progress_locked(const UploadSession &session) const
    {
        UploadProgress progress{
            .session_id = session.id,
            .received_chunks = session.chunks.size(),
            .total_chunks = session.total_chunks,
            .is_complete = session.chunks.size() == session.total_chunks,
            .missing_chunks = {},
            .missing_count = session.total_chunks - session.chunks.size(),
        };
        if (progress.is_complete)
        {
            return progress;
        }

        const auto cap = limits_.max_missing_reported;
        std::uint64_t next = 0;
        for (const auto &entry : session.chunks)
        {
            for (; next < entry.first && progress.missing_chunks.size() < cap; ++next)
            {
                progress.missing_chunks.push_back(next);
            }
            if (progress.missing_chunks.size() >= cap)
            {
                return progress;
            }
            next = entry.first + 1;
        }
        for (; next < session.total_chunks && progress.missing_chunks.size() < cap; ++next)
        {
            progress.missing_chunks.push_back(next);
        }
        return progress;
    }

    void UploadRegistry::retire_locked(UploadSession &session)
    {
        session.retired = true;
        release_staged_bytes(session.staged_bytes);
        session.staged_bytes = 0;
        session.chunks.clear();
    }

    std::size_t UploadRegistry::staging_headroom() const noexcept
    {
        const auto staged = staged_bytes_.load();
        if (staged >= limits_.max_staged_bytes)
        {
            return 0;
        }
        const auto headroom = limits_.max_staged_bytes - staged;
        return static_cast<std::size_t>(
            std::min<std::uint64_t>(headroom, std::numeric_limits<std::size_t>::max()));
    }

    void UploadRegistry::reserve_staged_bytes(std::uint64_t bytes)
    {
        auto current = staged_bytes_.load();
        do
        {
            if (current + bytes > limits_.max_staged_bytes)
            {
                spdlog::warn("Staging limit of {} bytes reached", limits_.max_staged_bytes);
                throw TransferError(ErrorCode::Busy, "Staged upload data limit reached");
            }
        } while (!staged_bytes_.compare_exchange_weak(current, current + bytes));
    }

    void UploadRegistry::release_staged_bytes(std::uint64_t bytes) noexcept
    {
        staged_bytes_.fetch_sub(bytes);
    }

} // namespace ferry::server
