#include "ferry/server/session.hpp"

#include <optional>

#include <nlohmann/json.hpp>

#include "ferry/encoding/base64.hpp"
#include "session_common.hpp"

namespace ferry::server
{

    void Session::handle_upload_init(const ferry::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<ferry::protocol::UploadInitRequest>();
        const auto destination = services_.filesystem.resolve_for_new_entry(request.destination.value_or(""));
        const auto session_id =
            services_.transfers.init_session(request.filename, request.total_chunks, destination, request.compressed);

        ferry::protocol::UploadInitResponse response{
            .session_id = session_id,
            .filename = request.filename,
            .total_chunks = request.total_chunks,
            .max_parallel_chunks = services_.transfers.planner().settings().max_parallel_chunks,
        };
        nlohmann::json payload = response;
        send_ok(std::move(payload), envelope.request_id);
    }

    void Session::handle_upload_chunk(const ferry::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<ferry::protocol::UploadChunkRequest>();
        const auto data = ferry::encoding::decode_base64(request.data_base64);
        if (!data)
        {
            send_error(ferry::ErrorCode::InvalidPayload, "Chunk data is not valid base64", envelope.request_id);
            return;
        }
        const auto progress =
            services_.transfers.put_chunk(request.session_id, request.chunk_id, *data, request.digest);
        nlohmann::json payload = session_common::to_progress_response(progress);
        send_ok(std::move(payload), envelope.request_id);
    }

    void Session::handle_upload_status(const ferry::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<ferry::protocol::SessionRequest>();
        const auto progress = services_.transfers.session_status(request.session_id);
        nlohmann::json payload = session_common::to_progress_response(progress);
        send_ok(std::move(payload), envelope.request_id);
    }

    void Session::handle_upload_finalize(const ferry::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<ferry::protocol::UploadFinalizeRequest>();
        std::optional<std::filesystem::path> destination;
        if (request.destination)
        {
            destination = services_.filesystem.resolve_for_new_entry(*request.destination);
        }
        const auto result = services_.transfers.finalize_session(request.session_id, destination);

        ferry::protocol::UploadFinalizeResponse response{
            .path = services_.filesystem.relative_to_root(result.final_path),
            .file_size = result.file_size,
        };
        nlohmann::json payload = response;
        send_ok(std::move(payload), envelope.request_id);
    }

    void Session::handle_upload_cancel(const ferry::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<ferry::protocol::SessionRequest>();
        services_.transfers.cancel_session(request.session_id);
        send_ok(nlohmann::json::object(), envelope.request_id);
    }

} // namespace ferry::server
