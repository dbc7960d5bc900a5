#include "ferry/client/connection.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <stdexcept>
#include <vector>

#include "ferry/error_codes.hpp"
#include "ferry/framing.hpp"

namespace ferry::client
{

    Connection::Connection(const std::string &host, std::uint16_t port, Logger &logger)
        : logger_(logger), socket_(io_context_)
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host, std::to_string(port));
        asio::connect(socket_, results);
        logger_.info("connect", "connected to ", host, ':', port);
    }

    ferry::protocol::ResponseEnvelope Connection::rpc(ferry::protocol::Command command,
                                                      const nlohmann::json &payload)
    {
        ferry::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = ferry::protocol::encode_frame(nlohmann::json(envelope));
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, ferry::protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = ferry::protocol::decode_frame_length(header);
        std::vector<char> buffer(size);
        asio::read(socket_, asio::buffer(buffer.data(), buffer.size()));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(std::string(buffer.begin(), buffer.end()));
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.error("rpc", "parse_error size=", size, " msg=", ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        auto response = json_response.get<ferry::protocol::ResponseEnvelope>();
        if (response.kind == ferry::protocol::ResponseKind::Error)
        {
            logger_.warn("rpc", "cmd=", ferry::protocol::to_string(command), " error=", ferry::to_string(response.error),
                        " msg=", response.message);
        }
        else
        {
            logger_.info("rpc", "cmd=", ferry::protocol::to_string(command), " ok");
        }
        return response;
    }

    nlohmann::json Connection::call(ferry::protocol::Command command, const nlohmann::json &payload)
    {
        auto response = rpc(command, payload);
        if (response.kind == ferry::protocol::ResponseKind::Error)
        {
            throw ferry::TransferError(response.error, response.message);
        }
        return std::move(response.payload);
    }

    std::string Connection::next_request_id()
    {
        return std::to_string(++request_counter_);
    }

} // namespace ferry::client
