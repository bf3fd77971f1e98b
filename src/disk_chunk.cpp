// src/disk_chunk.cpp
#include "disk_chunk.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <fstream>
#include <stdexcept> // For std::invalid_argument
#include <vector>

namespace fs = std::filesystem;

namespace SnapFetch
{
    namespace Chunks
    {

        namespace
        {
            constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;
        }

        DiskChunk::DiskChunk(const Checksum::Bytes &checksum, fs::path file)
            : checksum_(checksum), file_(std::move(file))
        {
            if (file_.empty())
            {
                throw std::invalid_argument("DiskChunk requires a backing file path.");
            }
        }

        Checksum::Bytes DiskChunk::checksum() const
        {
            return checksum_;
        }

        std::unique_ptr<std::istream> DiskChunk::inputStream() const
        {
            auto ifs = std::make_unique<std::ifstream>(file_, std::ios::binary);
            if (!ifs->is_open())
            {
                throw Errors::IOError("Failed to open chunk file for reading: " + file_.string());
            }
            return ifs;
        }

        std::uint64_t DiskChunk::copyTo(std::ostream &output) const
        {
            std::ifstream ifs(file_, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::IOError("Failed to open chunk file for reading: " + file_.string());
            }

            std::vector<char> buffer(COPY_BUFFER_SIZE);
            std::uint64_t bytes = 0;
            while (ifs)
            {
                ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = ifs.gcount();
                if (got <= 0)
                {
                    break;
                }
                output.write(buffer.data(), got);
                if (!output.good())
                {
                    throw Errors::IOError("Failed to write chunk data to output stream: " + file_.string());
                }
                bytes += static_cast<std::uint64_t>(got);
            }
            if (ifs.bad())
            {
                throw Errors::IOError("Failed to read all data from chunk file: " + file_.string());
            }

            Logging::logger()->debug("-- copyTo() - written (bytes): {}", bytes);
            return bytes;
        }

        std::string DiskChunk::toString() const
        {
            return "DiskChunk{checksum=" + Checksum::ChecksumUtility::toHex(checksum_) + ", file=" + file_.string() + "}";
        }

    } // namespace Chunks
} // namespace SnapFetch
