#include "ferry/server/session.hpp"

#include <nlohmann/json.hpp>

#include "ferry/encoding/base64.hpp"

namespace ferry::server
{

    void Session::handle_file_info(const ferry::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<ferry::protocol::FileInfoRequest>();
        const auto path = services_.filesystem.resolve(request.path);
        nlohmann::json payload = services_.transfers.info(path);
        send_ok(std::move(payload), envelope.request_id);
    }

    void Session::handle_download(const ferry::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<ferry::protocol::DownloadRequest>();
        const auto path = services_.filesystem.resolve(request.path);
        const auto file = services_.transfers.download_whole(path, request.compress);

        ferry::protocol::DownloadResponse response{
            .filename = file.filename,
            .file_size = file.file_size,
            .compressed = file.compressed,
            .data_base64 = ferry::encoding::encode_base64(file.data),
            .digest = file.digest,
        };
        nlohmann::json payload = response;
        send_ok(std::move(payload), envelope.request_id);
    }

    void Session::handle_download_chunk(const ferry::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<ferry::protocol::DownloadChunkRequest>();
        const auto path = services_.filesystem.resolve(request.path);
        const auto chunk = services_.transfers.download_chunk(path, request.chunk_id, request.compress);

        ferry::protocol::DownloadChunkResponse response{
            .chunk_id = chunk.chunk_id,
            .chunk_size = chunk.chunk_size,
            .total_chunks = chunk.total_chunks,
            .compressed = chunk.compressed,
            .data_base64 = ferry::encoding::encode_base64(chunk.data),
            .digest = chunk.digest,
        };
        nlohmann::json payload = response;
        send_ok(std::move(payload), envelope.request_id);
    }

} // namespace ferry::server
