/**
 * Ferry - Length-prefixed JSON framing.
 *
 * A frame is a 4-byte big-endian payload length followed by a UTF-8 JSON document.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace ferry::protocol
{

    constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Base64 chunk payloads of the default 1 MiB chunk fit with ample margin.
    constexpr std::uint32_t kMaxFramePayload = 64u * 1024u * 1024u;

    // Room left in a frame for the JSON envelope around a base64 data field.
    constexpr std::uint32_t kEnvelopeReserve = 64u * 1024u;

    // Largest binary payload whose base64 form still fits in one frame.
    constexpr std::uint64_t kMaxBinaryPayload = (kMaxFramePayload - kEnvelopeReserve) / 4 * 3;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Throws std::length_error when the announced length exceeds kMaxFramePayload.
    std::uint32_t decode_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace ferry::protocol
