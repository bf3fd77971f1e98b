// include/logging.hpp
#pragma once

#include <memory> // For std::shared_ptr
#include <string>

#include <spdlog/spdlog.h>

namespace SnapFetch
{
    namespace Logging
    {

        // Name of the shared logger registered with spdlog.
        inline constexpr const char *LOGGER_NAME = "snapfetch";

        // Create (or replace) the shared logger: colored stdout, plus a file sink
        // when log_file is non-empty. level is an spdlog level name ("trace",
        // "debug", "info", "warn", "error", "critical", "off").
        void init(const std::string &level, const std::string &log_file = "");

        // The shared logger. A stdout logger at info level is created on first use
        // if init() was never called.
        std::shared_ptr<spdlog::logger> logger();

    } // namespace Logging
} // namespace SnapFetch
