#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "ferry/client/logger.hpp"
#include "ferry/protocol.hpp"

namespace ferry::client
{

    // One blocking request/response channel. Parallel transfers open one per worker.
    class Connection
    {
    public:
        Connection(const std::string &host, std::uint16_t port, Logger &logger);

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        ferry::protocol::ResponseEnvelope rpc(ferry::protocol::Command command,
                                              const nlohmann::json &payload = nlohmann::json::object());

        // Like rpc() but throws TransferError carrying the server's code on an ERROR reply.
        nlohmann::json call(ferry::protocol::Command command,
                            const nlohmann::json &payload = nlohmann::json::object());

    private:
        std::string next_request_id();

        Logger &logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::uint64_t request_counter_{0};
    };

} // namespace ferry::client
