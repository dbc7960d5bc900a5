#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ferry/error_codes.hpp"
#include "ferry/framing.hpp"
#include "ferry/protocol.hpp"
#include "ferry/server/filesystem.hpp"
#include "ferry/server/transfer_service.hpp"

namespace ferry::server
{

    struct ServerServices
    {
        Filesystem &filesystem;
        TransferService &transfers;
    };

    // One client connection. Requests on a connection are handled in order;
    // separate connections are handled concurrently by the server's worker threads.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void dispatch(const ferry::protocol::RequestEnvelope &envelope);
        void send_response(const ferry::protocol::ResponseEnvelope &envelope);
        void send_ok(nlohmann::json payload, const std::optional<std::string> &request_id);
        void send_error(ferry::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);

        // Command handlers
        void handle_ping(const ferry::protocol::RequestEnvelope &envelope);
        void handle_file_info(const ferry::protocol::RequestEnvelope &envelope);
        void handle_download(const ferry::protocol::RequestEnvelope &envelope);
        void handle_download_chunk(const ferry::protocol::RequestEnvelope &envelope);
        void handle_upload_init(const ferry::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const ferry::protocol::RequestEnvelope &envelope);
        void handle_upload_status(const ferry::protocol::RequestEnvelope &envelope);
        void handle_upload_finalize(const ferry::protocol::RequestEnvelope &envelope);
        void handle_upload_cancel(const ferry::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, ferry::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool closed_{false};
    };

} // namespace ferry::server
