#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ferry/protocol.hpp"
#include "ferry/server/upload_registry.hpp"

namespace ferry::server::session_common
{

    ferry::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                       const std::optional<std::string> &request_id);

    // Frames the envelope. A response too large for one frame is replaced by an
    // Unsupported error carrying the same request id.
    std::vector<std::uint8_t> encode_response_frame(const ferry::protocol::ResponseEnvelope &envelope);

    ferry::protocol::UploadProgressResponse to_progress_response(const UploadProgress &progress);

} // namespace ferry::server::session_common
