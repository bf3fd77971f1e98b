// src/logging.cpp
#include "logging.hpp"
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace SnapFetch
{
    namespace Logging
    {

        namespace
        {
            std::mutex init_mutex;
        }

        void init(const std::string &level, const std::string &log_file)
        {
            std::lock_guard<std::mutex> lock(init_mutex);

            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            if (!log_file.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
            }

            auto new_logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
            new_logger->set_level(spdlog::level::from_str(level));
            new_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

            spdlog::drop(LOGGER_NAME);
            spdlog::register_logger(new_logger);
        }

        std::shared_ptr<spdlog::logger> logger()
        {
            auto existing = spdlog::get(LOGGER_NAME);
            if (existing)
            {
                return existing;
            }

            std::lock_guard<std::mutex> lock(init_mutex);
            existing = spdlog::get(LOGGER_NAME);
            if (existing)
            {
                return existing;
            }
            auto created = spdlog::stdout_color_mt(LOGGER_NAME);
            created->set_level(spdlog::level::info);
            return created;
        }

    } // namespace Logging
} // namespace SnapFetch
