#include "ferry/protocol.hpp"

#include <array>
#include <stdexcept>

namespace ferry::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 9> kCommandMappings{{
            {Command::Ping, "PING"},
            {Command::FileInfo, "FILE_INFO"},
            {Command::Download, "DOWNLOAD"},
            {Command::DownloadChunk, "DOWNLOAD_CHUNK"},
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadStatus, "UPLOAD_STATUS"},
            {Command::UploadFinalize, "UPLOAD_FINALIZE"},
            {Command::UploadCancel, "UPLOAD_CANCEL"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        void read_optional(const nlohmann::json &json, const char *key, std::optional<std::string> &target)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                target = it->get<std::string>();
            }
            else
            {
                target.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_optional(json, "id", envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_optional(json, "id", envelope.request_id);
    }

    void to_json(nlohmann::json &json, const FileInfoRequest &request)
    {
        json = {{"path", request.path}};
    }

    void from_json(const nlohmann::json &json, FileInfoRequest &request)
    {
        request.path = json.at("path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const FileTransferInfo &info)
    {
        json = {
            {"filename", info.filename},
            {"file_size", info.file_size},
            {"chunk_size", info.chunk_size},
            {"total_chunks", info.total_chunks},
            {"last_modified", info.last_modified},
            {"should_compress", info.should_compress},
            {"estimated_compression_ratio", info.estimated_compression_ratio},
            {"max_parallel_chunks", info.max_parallel_chunks},
        };
    }

    void from_json(const nlohmann::json &json, FileTransferInfo &info)
    {
        info.filename = json.at("filename").get<std::string>();
        info.file_size = json.value("file_size", 0ULL);
        info.chunk_size = json.value("chunk_size", 0ULL);
        info.total_chunks = json.value("total_chunks", 0ULL);
        info.last_modified = json.value("last_modified", 0ULL);
        info.should_compress = json.value("should_compress", false);
        info.estimated_compression_ratio = json.value("estimated_compression_ratio", 1.0);
        info.max_parallel_chunks = json.value("max_parallel_chunks", 1u);
    }

    void to_json(nlohmann::json &json, const DownloadRequest &request)
    {
        json = {
            {"path", request.path},
            {"compress", request.compress},
        };
    }

    void from_json(const nlohmann::json &json, DownloadRequest &request)
    {
        request.path = json.at("path").get<std::string>();
        request.compress = json.value("compress", false);
    }

    void to_json(nlohmann::json &json, const DownloadResponse &response)
    {
        json = {
            {"filename", response.filename},
            {"file_size", response.file_size},
            {"compressed", response.compressed},
            {"data", response.data_base64},
            {"digest", response.digest},
        };
    }

    void from_json(const nlohmann::json &json, DownloadResponse &response)
    {
        response.filename = json.value("filename", std::string{});
        response.file_size = json.value("file_size", 0ULL);
        response.compressed = json.value("compressed", false);
        response.data_base64 = json.at("data").get<std::string>();
        response.digest = json.value("digest", std::string{});
    }

    void to_json(nlohmann::json &json, const DownloadChunkRequest &request)
    {
        json = {
            {"path", request.path},
            {"chunk_id", request.chunk_id},
            {"compress", request.compress},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkRequest &request)
    {
        request.path = json.at("path").get<std::string>();
        request.chunk_id = json.at("chunk_id").get<std::uint64_t>();
        request.compress = json.value("compress", true);
    }

    void to_json(nlohmann::json &json, const DownloadChunkResponse &response)
    {
        json = {
            {"chunk_id", response.chunk_id},
            {"chunk_size", response.chunk_size},
            {"total_chunks", response.total_chunks},
            {"compressed", response.compressed},
            {"data", response.data_base64},
            {"digest", response.digest},
        };
    }

    void from_json(const nlohmann::json &json, DownloadChunkResponse &response)
    {
        response.chunk_id = json.at("chunk_id").get<std::uint64_t>();
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.compressed = json.value("compressed", false);
        response.data_base64 = json.at("data").get<std::string>();
        response.digest = json.value("digest", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"total_chunks", request.total_chunks},
            {"compressed", request.compressed},
        };
        if (request.destination)
        {
            json["destination"] = *request.destination;
        }
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.total_chunks = json.at("total_chunks").get<std::uint64_t>();
        request.compressed = json.value("compressed", true);
        read_optional(json, "destination", request.destination);
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"filename", response.filename},
            {"total_chunks", response.total_chunks},
            {"max_parallel_chunks", response.max_parallel_chunks},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.filename = json.value("filename", std::string{});
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.max_parallel_chunks = json.value("max_parallel_chunks", 1u);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"chunk_id", request.chunk_id},
            {"data", request.data_base64},
        };
        if (request.digest)
        {
            json["digest"] = *request.digest;
        }
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.chunk_id = json.at("chunk_id").get<std::uint64_t>();
        request.data_base64 = json.at("data").get<std::string>();
        read_optional(json, "digest", request.digest);
    }

    void to_json(nlohmann::json &json, const UploadProgressResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"received_chunks", response.received_chunks},
            {"total_chunks", response.total_chunks},
            {"is_complete", response.is_complete},
            {"missing_chunks", response.missing_chunks},
            {"missing_count", response.missing_count},
        };
    }

    void from_json(const nlohmann::json &json, UploadProgressResponse &response)
    {
        response.session_id = json.value("session_id", std::string{});
        response.received_chunks = json.value("received_chunks", 0ULL);
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.is_complete = json.value("is_complete", false);
        response.missing_chunks = json.value("missing_chunks", std::vector<std::uint64_t>{});
        response.missing_count = json.value("missing_count", 0ULL);
    }

    void to_json(nlohmann::json &json, const SessionRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, SessionRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadFinalizeRequest &request)
    {
        json = {{"session_id", request.session_id}};
        if (request.destination)
        {
            json["destination"] = *request.destination;
        }
    }

    void from_json(const nlohmann::json &json, UploadFinalizeRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        read_optional(json, "destination", request.destination);
    }

    void to_json(nlohmann::json &json, const UploadFinalizeResponse &response)
    {
        json = {
            {"path", response.path},
            {"file_size", response.file_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadFinalizeResponse &response)
    {
        response.path = json.at("path").get<std::string>();
        response.file_size = json.value("file_size", 0ULL);
    }

} // namespace ferry::protocol
