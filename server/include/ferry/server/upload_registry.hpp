#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::server
{

    struct RegistryLimits
    {
        std::size_t max_sessions{256};
        std::uint64_t max_staged_bytes{2ULL * 1024 * 1024 * 1024};
        std::size_t max_missing_reported{1024};
    };

    struct UploadProgress
    {
        std::string session_id;
        std::uint64_t received_chunks{};
        std::uint64_t total_chunks{};
        bool is_complete{};
        // Ascending, truncated to RegistryLimits::max_missing_reported entries.
        std::vector<std::uint64_t> missing_chunks;
        std::uint64_t missing_count{};
    };

    struct FinalizeResult
    {
        std::filesystem::path final_path;
        std::uint64_t file_size{};
    };

    /**
     * Owns every in-progress chunked upload and the chunk bytes staged for it.
     *
     * The registry mutex guards the id -> session map only. Each session has its
     * own mutex guarding its chunk map, so chunk writes to different sessions
     * never contend. Digest checks and decompression run before any lock is taken.
     * Exactly one of finalize, cancel and the expiry sweep retires a session; the
     * losers observe NotFound.
     *
     * All failures are reported as TransferError.
     */
    class UploadRegistry
    {
    public:
        using Clock = std::chrono::steady_clock;

        explicit UploadRegistry(RegistryLimits limits = {});

        UploadRegistry(const UploadRegistry &) = delete;
        UploadRegistry &operator=(const UploadRegistry &) = delete;

        std::string init(const std::string &filename, const std::filesystem::path &destination_dir,
                         std::uint64_t total_chunks, bool compressed);

        // The digest, when present, is checked against data exactly as received.
        UploadProgress put_chunk(const std::string &session_id, std::uint64_t chunk_id,
                                 std::span<const std::byte> data, const std::optional<std::string> &expected_digest);

        UploadProgress status(const std::string &session_id) const;

        FinalizeResult finalize(const std::string &session_id,
                                const std::optional<std::filesystem::path> &destination_dir = std::nullopt);

        void cancel(const std::string &session_id);

        // Returns the number of sessions removed.
        std::size_t sweep_expired(Clock::time_point now, std::chrono::seconds timeout);

        std::size_t session_count() const;

        std::uint64_t staged_bytes() const noexcept;

    private:
        struct UploadSession;

        std::shared_ptr<UploadSession> find_session(const std::string &session_id) const;
        UploadProgress progress_locked(const UploadSession &session) const;
        void retire_locked(UploadSession &session);
        // Bytes that may still be staged before max_staged_bytes is reached.
        std::size_t staging_headroom() const noexcept;
        void reserve_staged_bytes(std::uint64_t bytes);
        void release_staged_bytes(std::uint64_t bytes) noexcept;

        RegistryLimits limits_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;
        std::atomic<std::uint64_t> staged_bytes_{0};
    };

} // namespace ferry::server
