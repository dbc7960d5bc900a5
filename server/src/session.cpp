#include "ferry/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace ferry::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    Session::~Session()
    {
        spdlog::debug("Session for {} released", remote_endpoint());
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = ferry::protocol::decode_frame_length(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(ferry::ErrorCode::InvalidPayload, ex.what());
                                 read_frame_header();
                                 return;
                             }
                             process_message(json);
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        ferry::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<ferry::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(ferry::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), ferry::protocol::to_string(envelope.command));

        try
        {
            dispatch(envelope);
        }
        catch (const ferry::TransferError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const FilesystemError &fs)
        {
            send_error(fs.code(), fs.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ferry::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{}: {} failed: {}", remote_endpoint(), ferry::protocol::to_string(envelope.command),
                          ex.what());
            send_error(ferry::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::dispatch(const ferry::protocol::RequestEnvelope &envelope)
    {
        switch (envelope.command)
        {
        case ferry::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        case ferry::protocol::Command::FileInfo:
            handle_file_info(envelope);
            break;
        case ferry::protocol::Command::Download:
            handle_download(envelope);
            break;
        case ferry::protocol::Command::DownloadChunk:
            handle_download_chunk(envelope);
            break;
        case ferry::protocol::Command::UploadInit:
            handle_upload_init(envelope);
            break;
        case ferry::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case ferry::protocol::Command::UploadStatus:
            handle_upload_status(envelope);
            break;
        case ferry::protocol::Command::UploadFinalize:
            handle_upload_finalize(envelope);
            break;
        case ferry::protocol::Command::UploadCancel:
            handle_upload_cancel(envelope);
            break;
        default:
            send_error(ferry::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(const ferry::protocol::ResponseEnvelope &envelope)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(session_common::encode_response_frame(envelope));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                              }
                          });
    }

    void Session::send_ok(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        send_response(session_common::make_ok_response(std::move(payload), request_id));
    }

    void Session::send_error(ferry::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        ferry::protocol::ResponseEnvelope envelope;
        envelope.kind = ferry::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Session::handle_ping(const ferry::protocol::RequestEnvelope &envelope)
    {
        send_ok(nlohmann::json::object(), envelope.request_id);
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace ferry::server
