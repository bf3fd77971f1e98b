// src/chunk.cpp
#include "chunk.hpp"
#include <functional>  // For std::hash
#include <string>

namespace SnapFetch
{
    namespace Chunks
    {

        bool operator==(const Chunk &lhs, const Chunk &rhs)
        {
            if (&lhs == &rhs)
            {
                return true;
            }
            return lhs.checksum() == rhs.checksum();
        }

        bool operator!=(const Chunk &lhs, const Chunk &rhs)
        {
            return !(lhs == rhs);
        }

        size_t ChunkHash::operator()(const Chunk &chunk) const
        {
            Checksum::Bytes checksum = chunk.checksum();
            return std::hash<std::string>{}(std::string(checksum.begin(), checksum.end()));
        }

        size_t ChunkHash::operator()(const std::shared_ptr<const Chunk> &chunk) const
        {
            return chunk ? (*this)(*chunk) : 0;
        }

        bool ChunkEqual::operator()(const std::shared_ptr<const Chunk> &lhs, const std::shared_ptr<const Chunk> &rhs) const
        {
            if (!lhs || !rhs)
            {
                return lhs == rhs;
            }
            return *lhs == *rhs;
        }

    } // namespace Chunks
} // namespace SnapFetch
