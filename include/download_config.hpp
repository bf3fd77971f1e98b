// include/download_config.hpp
#pragma once

#include <string>
#include <cstdint>    // For std::uint64_t
#include <cstddef>    // For size_t
#include <filesystem> // For std::filesystem::path

#include <nlohmann/json.hpp>

namespace SnapFetch
{
    namespace Config
    {

        class DownloadConfig
        {
        public:
            // Cumulative asset size (32MB) at which a download batch is closed
            static constexpr std::uint64_t DEFAULT_BATCH_SIZE = 32 * 1024 * 1024;
            static constexpr size_t DEFAULT_THREADS = 1;

            std::uint64_t batch_size = DEFAULT_BATCH_SIZE;
            size_t threads = DEFAULT_THREADS;
            // Root under which StoreDownloadAssistant reassembles asset files
            std::filesystem::path output_dir = "backups";
            // DiskChunkStore directory holding fetched chunks
            std::filesystem::path chunks_dir = "chunks";

            // Read a JSON config file. Keys that are absent keep their defaults.
            // Throws std::runtime_error if the file is missing, unparsable or invalid.
            static DownloadConfig load(const std::filesystem::path &config_path);

            static DownloadConfig fromJson(const nlohmann::json &j);
            nlohmann::json toJson() const;

            // Throws std::runtime_error naming the offending key.
            void validate() const;

            // Create the directory (and parents) if needed; returns it unchanged.
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);
        };

    } // namespace Config
} // namespace SnapFetch
