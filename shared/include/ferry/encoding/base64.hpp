#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // std::nullopt when input is not padded standard base64. Whitespace is ignored.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace ferry::encoding
