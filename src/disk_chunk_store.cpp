// src/disk_chunk_store.cpp
#include "disk_chunk_store.hpp"
#include "disk_chunk.hpp"
#include "download_config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <fstream>
#include <functional> // For std::hash
#include <sstream>
#include <stdexcept>  // For std::invalid_argument
#include <thread>

namespace fs = std::filesystem;

namespace SnapFetch
{
    namespace Chunks
    {

        DiskChunkStore::DiskChunkStore(fs::path root) : root_(std::move(root))
        {
            Config::DownloadConfig::ensureDirectoryExists(root_);
        }

        fs::path DiskChunkStore::chunkPath(const Checksum::Bytes &checksum) const
        {
            if (checksum.empty())
            {
                throw std::invalid_argument("Chunk store requires a non-empty checksum.");
            }
            return root_ / Checksum::ChecksumUtility::toHex(checksum);
        }

        std::shared_ptr<const Chunk> DiskChunkStore::put(const std::vector<char> &data)
        {
            Checksum::Bytes checksum = Checksum::ChecksumUtility::sha256(data);
            fs::path chunk_path = chunkPath(checksum);

            if (fs::exists(chunk_path))
            {
                // Chunk already exists (deduplication)
                Logging::logger()->trace("Chunk already stored, skipping write: {}", chunk_path.filename().string());
                return std::make_shared<DiskChunk>(checksum, chunk_path);
            }

            writeAtomically(chunk_path, data);
            return std::make_shared<DiskChunk>(checksum, chunk_path);
        }

        std::shared_ptr<const Chunk> DiskChunkStore::put(const Checksum::Bytes &checksum, const std::vector<char> &data)
        {
            fs::path chunk_path = chunkPath(checksum);

            Checksum::Bytes actual = Checksum::ChecksumUtility::sha256(data);
            if (actual != checksum)
            {
                throw Errors::ChecksumError("Chunk checksum mismatch: expected " + Checksum::ChecksumUtility::toHex(checksum) +
                                            ", got " + Checksum::ChecksumUtility::toHex(actual));
            }

            if (!fs::exists(chunk_path))
            {
                writeAtomically(chunk_path, data);
            }
            return std::make_shared<DiskChunk>(checksum, chunk_path);
        }

        std::shared_ptr<const Chunk> DiskChunkStore::get(const Checksum::Bytes &checksum) const
        {
            fs::path chunk_path = chunkPath(checksum);
            if (!fs::exists(chunk_path))
            {
                return nullptr;
            }
            return std::make_shared<DiskChunk>(checksum, chunk_path);
        }

        bool DiskChunkStore::contains(const Checksum::Bytes &checksum) const
        {
            return fs::exists(chunkPath(checksum));
        }

        bool DiskChunkStore::verify(const Checksum::Bytes &checksum) const
        {
            fs::path chunk_path = chunkPath(checksum);
            std::ifstream ifs(chunk_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::IOError("Chunk file not found: " + chunk_path.string());
            }
            bool valid = Checksum::ChecksumUtility::sha256(ifs) == checksum;
            if (!valid)
            {
                Logging::logger()->warn("Stored chunk failed verification: {}", chunk_path.string());
            }
            return valid;
        }

        bool DiskChunkStore::remove(const Checksum::Bytes &checksum)
        {
            fs::path chunk_path = chunkPath(checksum);
            std::error_code ec;
            bool removed = fs::remove(chunk_path, ec);
            if (ec)
            {
                throw Errors::IOError("Error deleting chunk file " + chunk_path.string() + ": " + ec.message());
            }
            if (removed)
            {
                Logging::logger()->debug("Deleted chunk file: {}", chunk_path.string());
            }
            return removed;
        }

        void DiskChunkStore::writeAtomically(const fs::path &chunk_path, const std::vector<char> &data) const
        {
            // Unique per writer so concurrent puts of the same chunk never share a temp file.
            std::stringstream suffix;
            suffix << ".tmp-" << std::hash<std::thread::id>{}(std::this_thread::get_id());
            fs::path temp_path = chunk_path;
            temp_path += suffix.str();

            {
                std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw Errors::IOError("Failed to open file for writing chunk: " + temp_path.string());
                }
                ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
                ofs.flush();
                if (!ofs.good())
                {
                    ofs.close();
                    std::error_code ignored;
                    fs::remove(temp_path, ignored);
                    throw Errors::IOError("Failed to write all data to chunk file: " + temp_path.string());
                }
            }

            std::error_code ec;
            fs::rename(temp_path, chunk_path, ec);
            if (ec)
            {
                std::error_code ignored;
                fs::remove(temp_path, ignored);
                throw Errors::IOError("Failed to move chunk into place " + chunk_path.string() + ": " + ec.message());
            }
            Logging::logger()->debug("Chunk saved: {} ({} bytes)", chunk_path.filename().string(), data.size());
        }

    } // namespace Chunks
} // namespace SnapFetch
