#include "session_common.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"
#include "ferry/framing.hpp"

namespace ferry::server::session_common
{

    ferry::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                       const std::optional<std::string> &request_id)
    {
        ferry::protocol::ResponseEnvelope envelope;
        envelope.kind = ferry::protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.message = "";
        envelope.error = ferry::ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    std::vector<std::uint8_t> encode_response_frame(const ferry::protocol::ResponseEnvelope &envelope)
    {
        try
        {
            return ferry::protocol::encode_frame(nlohmann::json(envelope));
        }
        catch (const std::length_error &ex)
        {
            spdlog::warn("Response does not fit in a frame: {}", ex.what());
        }
        ferry::protocol::ResponseEnvelope fallback;
        fallback.kind = ferry::protocol::ResponseKind::Error;
        fallback.error = ferry::ErrorCode::Unsupported;
        fallback.message = "Response exceeds the maximum frame size; use chunked download";
        fallback.request_id = envelope.request_id;
        return ferry::protocol::encode_frame(nlohmann::json(fallback));
    }

    ferry::protocol::UploadProgressResponse to_progress_response(const UploadProgress &progress)
    {
        return ferry::protocol::UploadProgressResponse{
            .session_id = progress.session_id,
            .received_chunks = progress.received_chunks,
            .total_chunks = progress.total_chunks,
            .is_complete = progress.is_complete,
            .missing_chunks = progress.missing_chunks,
            .missing_count = progress.missing_count,
        };
    }

} // namespace ferry::server::session_common
