#include "ferry/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <iostream>

namespace ferry::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true);
            logger_ = std::make_shared<spdlog::logger>("ferry-client", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e %-5l [%t] %v");
            logger_->set_level(spdlog::level::info);
            // Retry and failure records survive a crash that follows them.
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "[warning] transfer log disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    void Logger::flush()
    {
        if (logger_)
        {
            logger_->flush();
        }
    }

} // namespace ferry::client
