#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    inline void init(const std::string& logFile, const std::string& level = "info")
    {
        // File logger becomes the default for the whole engine
        auto file_logger = spdlog::basic_logger_mt("file_logger", logFile);
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(spdlog::level::from_str(level));
        spdlog::flush_on(spdlog::level::info);
    }
}
