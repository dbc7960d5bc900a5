/**
 * Ferry - Wire protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ferry/error_codes.hpp"

namespace ferry::protocol
{

    enum class Command : std::uint8_t
    {
        Ping,
        FileInfo,
        Download,
        DownloadChunk,
        UploadInit,
        UploadChunk,
        UploadStatus,
        UploadFinalize,
        UploadCancel
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct FileInfoRequest
    {
        std::string path;
    };

    void to_json(nlohmann::json &json, const FileInfoRequest &request);
    void from_json(const nlohmann::json &json, FileInfoRequest &request);

    // Chunk layout and compression advice for one file, derived on demand.
    struct FileTransferInfo
    {
        std::string filename;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::uint64_t last_modified{};
        bool should_compress{};
        double estimated_compression_ratio{1.0};
        std::uint32_t max_parallel_chunks{};

        bool operator==(const FileTransferInfo &) const = default;
    };

    void to_json(nlohmann::json &json, const FileTransferInfo &info);
    void from_json(const nlohmann::json &json, FileTransferInfo &info);

    struct DownloadRequest
    {
        std::string path;
        bool compress{};
    };

    void to_json(nlohmann::json &json, const DownloadRequest &request);
    void from_json(const nlohmann::json &json, DownloadRequest &request);

    struct DownloadResponse
    {
        std::string filename;
        std::uint64_t file_size{};
        bool compressed{};
        std::string data_base64;
        std::string digest;
    };

    void to_json(nlohmann::json &json, const DownloadResponse &response);
    void from_json(const nlohmann::json &json, DownloadResponse &response);

    struct DownloadChunkRequest
    {
        std::string path;
        std::uint64_t chunk_id{};
        bool compress{true};
    };

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request);
    void from_json(const nlohmann::json &json, DownloadChunkRequest &request);

    struct DownloadChunkResponse
    {
        std::uint64_t chunk_id{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        bool compressed{};
        std::string data_base64;
        std::string digest;
    };

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response);
    void from_json(const nlohmann::json &json, DownloadChunkResponse &response);

    struct UploadInitRequest
    {
        std::string filename;
        std::uint64_t total_chunks{};
        std::optional<std::string> destination{};
        bool compressed{true};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string session_id;
        std::string filename;
        std::uint64_t total_chunks{};
        std::uint32_t max_parallel_chunks{};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadChunkRequest
    {
        std::string session_id;
        std::uint64_t chunk_id{};
        std::string data_base64;
        std::optional<std::string> digest{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    // Reply to UPLOAD_CHUNK and UPLOAD_STATUS.
    struct UploadProgressResponse
    {
        std::string session_id;
        std::uint64_t received_chunks{};
        std::uint64_t total_chunks{};
        bool is_complete{};
        std::vector<std::uint64_t> missing_chunks;
        std::uint64_t missing_count{};
    };

    void to_json(nlohmann::json &json, const UploadProgressResponse &response);
    void from_json(const nlohmann::json &json, UploadProgressResponse &response);

    struct SessionRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const SessionRequest &request);
    void from_json(const nlohmann::json &json, SessionRequest &request);

    struct UploadFinalizeRequest
    {
        std::string session_id;
        std::optional<std::string> destination{};
    };

    void to_json(nlohmann::json &json, const UploadFinalizeRequest &request);
    void from_json(const nlohmann::json &json, UploadFinalizeRequest &request);

    struct UploadFinalizeResponse
    {
        std::string path;
        std::uint64_t file_size{};
    };

    void to_json(nlohmann::json &json, const UploadFinalizeResponse &response);
    void from_json(const nlohmann::json &json, UploadFinalizeResponse &response);

} // namespace ferry::protocol
