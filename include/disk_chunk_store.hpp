// include/disk_chunk_store.hpp
#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "chunk.hpp"
#include "checksum_utility.hpp"

namespace SnapFetch
{
    namespace Chunks
    {

        // Directory of chunk files, each named by the hex SHA-256 of its content.
        // Owns retention: chunks handed out stay valid until remove() is called.
        class DiskChunkStore
        {
        public:
            // Creates root if it does not exist.
            explicit DiskChunkStore(std::filesystem::path root);

            // Store data under its own SHA-256. Existing chunks are not rewritten.
            std::shared_ptr<const Chunk> put(const std::vector<char> &data);

            // Store data under checksum after checking that data hashes to it.
            // Throws Errors::ChecksumError on mismatch, Errors::IOError on write failure.
            std::shared_ptr<const Chunk> put(const Checksum::Bytes &checksum, const std::vector<char> &data);

            // nullptr if the store holds no chunk for checksum.
            std::shared_ptr<const Chunk> get(const Checksum::Bytes &checksum) const;

            bool contains(const Checksum::Bytes &checksum) const;

            // Re-hash the stored file and compare it with checksum.
            // Throws Errors::IOError if the chunk is missing or unreadable.
            bool verify(const Checksum::Bytes &checksum) const;

            // Returns false if there was nothing to remove.
            bool remove(const Checksum::Bytes &checksum);

            std::filesystem::path chunkPath(const Checksum::Bytes &checksum) const;

            const std::filesystem::path &root() const { return root_; }

        private:
            std::filesystem::path root_;

            void writeAtomically(const std::filesystem::path &chunk_path, const std::vector<char> &data) const;
        };

    } // namespace Chunks
} // namespace SnapFetch
