// src/download_config.cpp
#include "download_config.hpp"
#include "logging.hpp"
#include <cstdint>
#include <fstream>
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace SnapFetch
{
    namespace Config
    {

        namespace
        {
            // nlohmann casts between number types silently, so a negative value would wrap.
            std::uint64_t readCount(const nlohmann::json &j, const char *key)
            {
                const nlohmann::json &value = j.at(key);
                bool non_negative = value.is_number_unsigned() ||
                                    (value.is_number_integer() && value.get<std::int64_t>() >= 0);
                if (!non_negative)
                {
                    throw std::runtime_error(std::string("Download config: ") + key + " must be a non-negative integer.");
                }
                return value.get<std::uint64_t>();
            }
        }

        DownloadConfig DownloadConfig::fromJson(const nlohmann::json &j)
        {
            DownloadConfig config;
            if (!j.is_object())
            {
                throw std::runtime_error("Download config must be a JSON object.");
            }
            try
            {
                if (j.contains("batch_size"))
                {
                    config.batch_size = readCount(j, "batch_size");
                }
                if (j.contains("threads"))
                {
                    config.threads = static_cast<size_t>(readCount(j, "threads"));
                }
                if (j.contains("output_dir"))
                {
                    config.output_dir = j.at("output_dir").get<std::string>();
                }
                if (j.contains("chunks_dir"))
                {
                    config.chunks_dir = j.at("chunks_dir").get<std::string>();
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error(std::string("Invalid value in download config: ") + e.what());
            }
            config.validate();
            return config;
        }

        nlohmann::json DownloadConfig::toJson() const
        {
            return nlohmann::json{
                {"batch_size", batch_size},
                {"threads", threads},
                {"output_dir", output_dir.string()},
                {"chunks_dir", chunks_dir.string()}};
        }

        DownloadConfig DownloadConfig::load(const fs::path &config_path)
        {
            if (!fs::exists(config_path))
            {
                throw std::runtime_error("Config file not found: " + config_path.string());
            }

            std::ifstream ifs(config_path);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open config file for reading: " + config_path.string());
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Error parsing JSON config file " + config_path.string() + ": " + e.what());
            }

            DownloadConfig config = fromJson(j);
            Logging::logger()->debug("Loaded download config {}: {}", config_path.string(), config.toJson().dump());
            return config;
        }

        void DownloadConfig::validate() const
        {
            if (batch_size == 0)
            {
                throw std::runtime_error("Download config: batch_size must be positive.");
            }
            if (threads == 0)
            {
                throw std::runtime_error("Download config: threads must be positive.");
            }
        }

        fs::path DownloadConfig::ensureDirectoryExists(const fs::path &dir_path)
        {
            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        Logging::logger()->info("Created directory: {}", dir_path.string());
                    }
                    else if (!fs::exists(dir_path))
                    {
                        // Another process may have created it in the meantime; only fail if it is still absent.
                        throw std::runtime_error("Failed to create directory: " + dir_path.string());
                    }
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

    } // namespace Config
} // namespace SnapFetch
