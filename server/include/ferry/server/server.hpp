#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <thread>
#include <vector>

#include "ferry/server/config.hpp"
#include "ferry/server/expiry_sweeper.hpp"
#include "ferry/server/filesystem.hpp"
#include "ferry/server/transfer_service.hpp"
#include "ferry/server/upload_registry.hpp"

namespace ferry::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        Filesystem filesystem_;
        UploadRegistry upload_registry_;
        TransferService transfer_service_;
        ExpirySweeper sweeper_;

        std::vector<std::thread> workers_;
    };

} // namespace ferry::server
